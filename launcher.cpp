#include <iostream>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstdlib>

std::map<std::string, uint32_t> colorsByName = {
    {"aquamarine", 0x7fffd4},
    {"black", 0x000000},
    {"coral", 0xFF7F50},
    {"deeppink", 0xFF1493},
    {"gray", 0x808080},
    {"hotpink", 0xFF69B4},
    {"lavender", 0xE6E6FA},
    {"lightcyan", 0xE0FFFF},
    {"lightgray", 0xD3D3D3},
    {"navy", 0x000080},
    {"powderblue", 0xB0E0E6},
    {"red", 0xFF0000},
    {"white", 0xFFFFFF},
};

uint32_t expand12BitColorTo24(uint32_t color)
{
    uint8_t r = (color & 0xF00) >> 8;
    r = (r << 4) | r;
    uint8_t g = (color & 0x0F0) >> 4;
    g = (g << 4) | g;
    uint8_t b = (color & 0x00F) >> 0;
    b = (b << 4) | b;
    return (r << 16) | (g << 8) | (b << 0);
}

// Accepts "#RGB", "#RRGGBB", bare hex digits or a color name.  Throws
// std::out_of_range for unknown names.
std::string convertToHexColor(const std::string& name)
{
    uint32_t color;

    if(colorsByName.count(name) != 0) {
        color = colorsByName.at(name);
    } else {
        std::string digits = (!name.empty() && (name[0] == '#')) ? name.substr(1) : name;
        char *end = nullptr;
        color = strtoul(digits.c_str(), &end, 16);
        if(digits.empty() || (*end != '\0')) {
            throw std::out_of_range("unknown color \"" + name + "\"");
        }
        if(digits.length() <= 3) { // Just three hex digits
            color = expand12BitColorTo24(color);
        }
    }

    std::stringstream ss;
    ss << std::setfill('0') << std::setw(6) << std::hex << color;
    return ss.str();
}

std::string optionAsString(const nlohmann::json& value)
{
    if(value.type() == nlohmann::json::value_t::string) {
        return value.get<std::string>();
    } else if(value.is_number_integer()) {
        return std::to_string(value.get<int>());
    } else {
        std::stringstream ss;
        ss << value.get<double>();
        return ss.str();
    }
}

int main(int argc, char **argv)
{
    if(argc < 2) {
        std::cerr << "usage: " << argv[0] << " programs.json [romsdir programToRun]\n";
        exit(EXIT_FAILURE);
    }

    std::ifstream programsFile(argv[1]);
    if(!programsFile) {
        std::cerr << "couldn't open \"" << argv[1] << "\"\n";
        exit(EXIT_FAILURE);
    }

    nlohmann::json programs;
    try {
        programsFile >> programs;
    } catch(const nlohmann::json::parse_error& e) {
        std::cerr << argv[1] << ": " << e.what() << "\n";
        exit(EXIT_FAILURE);
    }

    if(argc < 4) {
        size_t maxlength = 0;
        for (const auto& [program, specifics] : programs.items()) {
            maxlength = std::max(program.length(), maxlength);
        }
        for (const auto& [program, specifics] : programs.items()) {
            std::cout << std::setw(maxlength) << program << std::setw(0) << " : " << specifics.value("title", "") << "\n";
            std::cout << std::setw(maxlength) << "" << std::setw(0) << "   " << specifics.value("desc", "") << "\n";
        }
        exit(EXIT_SUCCESS);
    }

    std::string romsDir = argv[2];
    std::string chosenProgram = argv[3];

    if(!programs.contains(chosenProgram)) {
        std::cerr << "unknown program \"" << chosenProgram << "\"\n";
        exit(EXIT_FAILURE);
    }

    const auto& program = programs[chosenProgram];

    std::string platform = program.value("platform", "chip8");
    if((platform == "schip") || (platform == "xochip")) {
        std::cerr << "program \"" << chosenProgram << "\" requires the \"" << platform << "\" platform; only plain CHIP-8 is emulated\n";
        exit(EXIT_FAILURE);
    }

    std::vector<std::string> emulatorArgs;

    emulatorArgs.push_back("phosphor8");

    const nlohmann::json options = program.value("options", nlohmann::json::object());
    try {
        if(options.contains("tickrate")) {
            emulatorArgs.push_back("--rate " + optionAsString(options["tickrate"]));
        }
        if(options.contains("decay")) {
            emulatorArgs.push_back("--decay " + optionAsString(options["decay"]));
        }
        if(options.contains("backgroundColor")) {
            emulatorArgs.push_back("--color 0 " + convertToHexColor(options["backgroundColor"].get<std::string>()));
        }
        if(options.contains("fillColor")) {
            emulatorArgs.push_back("--color 1 " + convertToHexColor(options["fillColor"].get<std::string>()));
        }
    } catch(const nlohmann::json::exception& e) {
        std::cerr << "bad options for \"" << chosenProgram << "\": " << e.what() << "\n";
        exit(EXIT_FAILURE);
    } catch(const std::out_of_range& e) {
        std::cerr << "bad color for \"" << chosenProgram << "\": " << e.what() << "\n";
        exit(EXIT_FAILURE);
    }

    emulatorArgs.push_back(romsDir + "/" + chosenProgram + ".ch8");

    bool first = true;
    for(const auto& arg: emulatorArgs) {
        if(!first) {
            std::cout << " ";
        }
        std::cout << arg;
        first = false;
    }
    std::cout << "\n";

    exit(EXIT_SUCCESS);
}
