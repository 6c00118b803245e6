#include <algorithm>
#include <array>
#include <map>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <chrono>

#ifdef __APPLE__
#define XCODE_MISSING_FILESYSTEM_FOR_YEARS
#include <libgen.h>
#else
#include <filesystem>
#endif

#include <MiniFB.h>

#include "debug.h"
#include "display.h"
#include "fault.h"
#include "machine.h"
#include "memory.h"

constexpr int DEFAULT_SCALE = 12;
constexpr int RATE_STEP = 1;
constexpr float DECAY_STEP = 0.05f;

typedef std::array<uint8_t, 3> vec3ub;

vec3ub vec3ubFromInts(int r, int g, int b)
{
    return { (uint8_t)r, (uint8_t)g, (uint8_t)b };
}

// MiniFB window, keypad and beeper for one machine.  The renderer maps
// phosphor intensity 0..1 onto a 256-entry ramp from the background color
// to the phosphor color.
struct Interface
{
    std::array<vec3ub, 2> colors;
    std::array<uint32_t, 256> shades;
    bool closed = false;
    std::array<bool, KEY_COUNT> keyPressed;

    // runtime adjustments requested from the keyboard, consumed by main
    int rateAdjustment = 0;
    int decayAdjustment = 0;
    bool restartRequested = false;

    bool succeeded = false;

    mfb_window *window;
    int windowWidth;
    int windowHeight;
    std::vector<uint32_t> windowBuffer;

    Interface(const std::string& name, int scale, bool fullscreen) :
        windowWidth(DISPLAY_WIDTH * scale),
        windowHeight(DISPLAY_HEIGHT * scale)
    {
        keyPressed.fill(false);
        window = mfb_open_ex(name.c_str(), windowWidth, windowHeight, fullscreen ? WF_FULLSCREEN : WF_RESIZABLE);
        if (window) {
            windowBuffer.resize(windowWidth * windowHeight);
            mfb_set_user_data(window, (void *) this);
            mfb_set_resize_callback(window, resizecb);
            mfb_set_keyboard_callback(window, keyboardcb);
            succeeded = true;
        }
        colors[0] = {0, 0, 0};
        colors[1] = {255, 255, 255};
        buildShades();
    }

    void buildShades()
    {
        for(int level = 0; level < 256; level++) {
            uint8_t c[3];
            for(int i = 0; i < 3; i++) {
                c[i] = colors[0][i] + (colors[1][i] - colors[0][i]) * level / 255;
            }
            shades[level] = MFB_RGB(c[0], c[1], c[2]);
        }
    }

    bool redraw(const PhosphorDisplay& display)
    {
        for(int row = 0; row < windowHeight; row++) {
            int displayY = row * DISPLAY_HEIGHT / windowHeight;
            for(int col = 0; col < windowWidth; col++) {
                int displayX = col * DISPLAY_WIDTH / windowWidth;
                float glow = std::clamp(display.brightness(displayX, displayY), 0.0f, 1.0f);
                windowBuffer[col + row * windowWidth] = shades.at(static_cast<int>(glow * 255.0f + 0.5f));
            }
        }
        int status = mfb_update_ex(window, windowBuffer.data(), windowWidth, windowHeight);
        closed = (status < 0);
        return status >= 0;
    }

    void resize(int width, int height)
    {
        windowWidth = width;
        windowHeight = height;
        windowBuffer.assign(windowWidth * windowHeight, shades[0]);
    }

    static void resizecb(mfb_window *window, int width, int height)
    {
        Interface *ifc = static_cast<Interface *>(mfb_get_user_data(window));
        ifc->resize(width, height);
        mfb_set_viewport(window, 0, 0, width, height);
    }

    void keyboard(mfb_key key, mfb_key_mod mod, bool isPressed)
    {
        switch(key) {
            case KB_KEY_ESCAPE:
                if(isPressed) {
                    mfb_close(window);
                    closed = true;
                }
                break;
            case KB_KEY_EQUAL: if(isPressed) { rateAdjustment += RATE_STEP; } break;
            case KB_KEY_MINUS: if(isPressed) { rateAdjustment -= RATE_STEP; } break;
            case KB_KEY_RIGHT_BRACKET: if(isPressed) { decayAdjustment++; } break;
            case KB_KEY_LEFT_BRACKET: if(isPressed) { decayAdjustment--; } break;
            case KB_KEY_BACKSPACE: if(isPressed) { restartRequested = true; } break;
            case KB_KEY_1: keyPressed[0x1] = isPressed; break;
            case KB_KEY_2: keyPressed[0x2] = isPressed; break;
            case KB_KEY_3: keyPressed[0x3] = isPressed; break;
            case KB_KEY_4: keyPressed[0xC] = isPressed; break;
            case KB_KEY_Q: keyPressed[0x4] = isPressed; break;
            case KB_KEY_W: keyPressed[0x5] = isPressed; break;
            case KB_KEY_E: keyPressed[0x6] = isPressed; break;
            case KB_KEY_R: keyPressed[0xD] = isPressed; break;
            case KB_KEY_A: keyPressed[0x7] = isPressed; break;
            case KB_KEY_S: keyPressed[0x8] = isPressed; break;
            case KB_KEY_D: keyPressed[0x9] = isPressed; break;
            case KB_KEY_F: keyPressed[0xE] = isPressed; break;
            case KB_KEY_Z: keyPressed[0xA] = isPressed; break;
            case KB_KEY_X: keyPressed[0x0] = isPressed; break;
            case KB_KEY_C: keyPressed[0xB] = isPressed; break;
            case KB_KEY_V: keyPressed[0xF] = isPressed; break;
            default: /* pass */ break;
        }
    }

    static void keyboardcb(mfb_window *window, mfb_key key, mfb_key_mod mod, bool isPressed)
    {
        Interface *ifc = static_cast<Interface *>(mfb_get_user_data(window));
        ifc->keyboard(key, mod, isPressed);
    }

    bool iterate(PhosphorDisplay& display)
    {
        bool success = true;
        if(display.displayChanged) {
            success = redraw(display);
            display.displayChanged = false;
        } else {
            success = (mfb_update_events(window) >= 0);
        }
        if(success) {
            mfb_wait_sync(window);
        }
        return success && !closed;
    }

    void startSound()
    {
        // terminal bell stands in for the tone
        fputs("\a", stdout);
        fflush(stdout);
    }

    void stopSound()
    {
    }

    bool pressed(uint8_t key)
    {
        return keyPressed.at(key);
    }
};

void usage(const char *name)
{
    fprintf(stderr, "usage: %s [options] ROM.ch8\n", name);
    fprintf(stderr, "options:\n");
    fprintf(stderr, "\t--rate N           - issue N instructions per 60Hz frame (default %d)\n", DEFAULT_CYCLES_PER_FRAME);
    fprintf(stderr, "\t--decay D          - phosphor decay per frame, 0 to %.2f (default %.2f)\n", MAX_DECAY, DEFAULT_DECAY);
    fprintf(stderr, "\t--color N RRGGBB   - set color 0 (background) or 1 (phosphor) to RRGGBB\n");
    fprintf(stderr, "\t--scale N          - window pixels per CHIP-8 pixel (default %d)\n", DEFAULT_SCALE);
    fprintf(stderr, "\t--fullscreen       - open a fullscreen window\n");
    fprintf(stderr, "\t--seed N           - seed the random number instruction\n");
    fprintf(stderr, "\t--debug name       - enable tracing, one of:\n");
    fprintf(stderr, "\t                     \"state\" : registers before each instruction\n");
    fprintf(stderr, "\t                     \"asm\" : disassemble each instruction\n");
    fprintf(stderr, "\t                     \"draw\" : each sprite pixel drawn\n");
    fprintf(stderr, "\t                     \"fault\" : exit on the first instruction fault\n");
    fprintf(stderr, "\t                     \"keys\" : keypad queries\n");
    fprintf(stderr, "\t                     \"timing\" : cycles and timer ticks per frame\n");
    fprintf(stderr, "keys while running:\n");
    fprintf(stderr, "\t= -                - raise / lower instructions per frame\n");
    fprintf(stderr, "\t] [                - raise / lower phosphor decay\n");
    fprintf(stderr, "\tBackspace          - restart the ROM\n");
    fprintf(stderr, "\tEscape             - quit\n");
}

bool readROM(const char *path, std::vector<uint8_t>& rom)
{
    FILE *fp = fopen(path, "rb");
    if(fp == nullptr) {
        fprintf(stderr, "couldn't open ROM \"%s\": %s\n", path, strerror(errno));
        return false;
    }
    rom.clear();
    uint8_t buffer[512];
    size_t count;
    while((count = fread(buffer, 1, sizeof(buffer), fp)) > 0) {
        rom.insert(rom.end(), buffer, buffer + count);
    }
    bool failed = ferror(fp) != 0;
    fclose(fp);
    if(failed) {
        fprintf(stderr, "couldn't read ROM \"%s\"\n", path);
        return false;
    }
    return true;
}

int main(int argc, char **argv)
{
    const char *progname = argv[0];
    argc -= 1;
    argv += 1;

    int ticksPerField = DEFAULT_CYCLES_PER_FRAME;
    float decay = DEFAULT_DECAY;
    int scale = DEFAULT_SCALE;
    bool fullscreen = false;
    bool seeded = false;
    uint32_t seed = 0;
    std::map<int,vec3ub> colorTable;

    while((argc > 0) && (argv[0][0] == '-')) {
        if(strcmp(argv[0], "--color") == 0) {
            if(argc < 3) {
                fprintf(stderr, "--color option requires a color number and color.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            int colorIndex = atoi(argv[1]);
            if((colorIndex < 0) || (colorIndex > 1)) {
                fprintf(stderr, "color number must be 0 or 1.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            uint32_t colorName = strtoul(argv[2], nullptr, 16);
            vec3ub color = vec3ubFromInts((colorName >> 16) & 0xff, (colorName >> 8) & 0xff, colorName & 0xff);
            colorTable[colorIndex] = color;
            argv += 3;
            argc -= 3;
        } else if(strcmp(argv[0], "--rate") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--rate option requires a rate number value.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            ticksPerField = atoi(argv[1]);
            if(ticksPerField < 1) {
                fprintf(stderr, "rate must be at least 1.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            argv += 2;
            argc -= 2;
        } else if(strcmp(argv[0], "--decay") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--decay option requires a decay factor.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            decay = strtof(argv[1], nullptr);
            argv += 2;
            argc -= 2;
        } else if(strcmp(argv[0], "--scale") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--scale option requires a scale factor.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            scale = atoi(argv[1]);
            if(scale < 1) {
                fprintf(stderr, "scale must be at least 1.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            argv += 2;
            argc -= 2;
        } else if(strcmp(argv[0], "--fullscreen") == 0) {
            fullscreen = true;
            argv += 1;
            argc -= 1;
        } else if(strcmp(argv[0], "--seed") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--seed option requires a seed value.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            seed = strtoul(argv[1], nullptr, 0);
            seeded = true;
            argv += 2;
            argc -= 2;
        } else if(strcmp(argv[0], "--debug") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--debug option requires a debug flag to enable.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            std::string debugKeyword = argv[1];
            if(keywordsToDebugFlags.count(debugKeyword) == 0) {
                fprintf(stderr, "unknown debug flag \"%s\".\n", argv[1]);
                usage(progname);
                exit(EXIT_FAILURE);
            }
            debug |= keywordsToDebugFlags.at(debugKeyword);
            fprintf(stderr, "debug value now 0x%02X\n", debug);
            argv += 2;
            argc -= 2;
        } else if(
            (strcmp(argv[0], "-help") == 0) ||
            (strcmp(argv[0], "-h") == 0) ||
            (strcmp(argv[0], "-?") == 0))
        {
            usage(progname);
            exit(EXIT_SUCCESS);
        } else {
            fprintf(stderr, "unknown parameter \"%s\"\n", argv[0]);
            usage(progname);
            exit(EXIT_FAILURE);
        }
    }

    if(argc < 1) {
        usage(progname);
        exit(EXIT_FAILURE);
    }

    std::vector<uint8_t> rom;
    if(!readROM(argv[0], rom)) {
        exit(EXIT_FAILURE);
    }

    if(rom.size() > PROGRAM_CAPACITY) {
        fprintf(stderr, "ROM \"%s\" is %zu bytes but only %u bytes fit above %03X\n",
            argv[0], rom.size(), PROGRAM_CAPACITY, PROGRAM_START);
        exit(EXIT_FAILURE);
    }

#ifdef XCODE_MISSING_FILESYSTEM_FOR_YEARS
    char *base = strdup(argv[0]);
    Interface interface(basename(base), scale, fullscreen);
    free(base);
#else
    std::filesystem::path base(argv[0]);
    Interface interface(base.filename().string(), scale, fullscreen);
#endif

    if(!interface.succeeded) {
        fprintf(stderr, "couldn't open a window\n");
        exit(EXIT_FAILURE);
    }

    for(const auto& [index, color] : colorTable) {
        interface.colors[index] = color;
    }
    interface.buildShades();

    Chip8Machine<Interface> machine(ticksPerField, decay);
    if(!machine.loadProgram(rom, interface)) {
        fprintf(stderr, "couldn't load ROM \"%s\"\n", argv[0]);
        exit(EXIT_FAILURE);
    }
    if(seeded) {
        machine.interpreter.seed(seed);
    }

    std::chrono::time_point<std::chrono::system_clock> interfaceThen = std::chrono::system_clock::now();

    bool done = false;
    while(!done) {

        std::chrono::time_point<std::chrono::system_clock> interfaceNow;
        float dt;
        do {
            interfaceNow = std::chrono::system_clock::now();
            auto elapsed = std::chrono::duration_cast<std::chrono::duration<float>>(interfaceNow - interfaceThen);
            dt = elapsed.count();
        } while(dt < .0166f);
        interfaceThen = interfaceNow;

        StepResult result = machine.runFrame(interface, dt);
        if(isFault(result)) {
            fprintf(stderr, "%s\n", describeFault(machine.interpreter.fault).c_str());
            if(debug & DEBUG_FAIL_ON_FAULT) {
                printf("exit on instruction fault\n");
                exit(EXIT_FAILURE);
            }
            if(isFetchFault(machine.interpreter.fault)) {
                fprintf(stderr, "program ran off the end of memory\n");
                exit(EXIT_FAILURE);
            }
            machine.interpreter.skipInstruction();
        }

        done = !interface.iterate(machine.display);

        if(interface.rateAdjustment != 0) {
            machine.setCyclesPerFrame(machine.cyclesPerFrame + interface.rateAdjustment);
            interface.rateAdjustment = 0;
            printf("rate now %d instructions per frame\n", machine.cyclesPerFrame);
        }
        if(interface.decayAdjustment != 0) {
            machine.setDecay(machine.display.getDecay() + interface.decayAdjustment * DECAY_STEP);
            interface.decayAdjustment = 0;
            printf("decay now %.2f\n", machine.display.getDecay());
        }
        if(interface.restartRequested) {
            interface.restartRequested = false;
            if(!machine.restart(interface)) {
                fprintf(stderr, "couldn't restart ROM\n");
                exit(EXIT_FAILURE);
            }
        }
    }
}
