/*
 * main.cpp
 *
 * Purpose:
 *   Demo entry point and frame loop for the seasonal calendar.
 *   Responsibilities include:
 *     - GLFW initialization and window lifecycle
 *     - Config discovery (argv[1] or assets/config.yml)
 *     - Calendar system startup/shutdown around an in-process WorldClock
 *     - Per-frame update (input, environment, one clock invocation per configured interval)
 *     - Rendering the sky colour as the clear colour and the status line as the window title
 *
 * Keys:
 *   B : sleep (host cycle runs fast until morning)
 *   W : wake (take back the cycle if it is morning)
 *   E : end the active event
 *   R : reload configuration and events
 *   N : jump to the next month (Shift+N: previous month)
 *   Esc : quit
 */

#include <filesystem>
#include <iostream>
#include <string>

#include <GLFW/glfw3.h>

#include "app/CalendarCommand.h"
#include "app/CalendarSystem.h"
#include "app/WorldActionDispatcher.h"
#include "core/Input.h"
#include "environment/Environment.h"

static int g_fbW = 1280;
static int g_fbH = 720;

// Host cycle multiplier while everyone sleeps.
static constexpr double kSleepCycleSpeed = 60.0;

static void FramebufferSizeCallback(GLFWwindow*, int w, int h) {
    g_fbW = (w > 0) ? w : 1;
    g_fbH = (h > 0) ? h : 1;
    glViewport(0, 0, g_fbW, g_fbH);
}

/*
 * Attempts to locate the project assets directory by walking up from CWD.
 *
 * Returns:
 *   Path to ".../assets" if found; empty path otherwise.
 */
static std::filesystem::path FindAssetsRoot() {
    namespace fs = std::filesystem;
    fs::path p = fs::current_path();
    for (int i = 0; i < 8; ++i) {
        fs::path cand = p / "assets";
        if (fs::exists(cand) && fs::is_directory(cand)) return cand;
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return {};
}

// Shows the status line in the window title bar.
class WindowTitleSink : public StatusSink {
public:
    explicit WindowTitleSink(GLFWwindow* window) : m_window(window) {}

    void showStatus(const std::string& title, double progress) override {
        std::string text = title;
        if (progress > 0.0) {
            text += "  [" + std::to_string(static_cast<int>(progress * 100.0)) + "%]";
        }
        if (text != m_last) {
            glfwSetWindowTitle(m_window, text.c_str());
            m_last = text;
        }
    }

private:
    GLFWwindow* m_window;
    std::string m_last;
};

static void PrintReply(const CommandResult& result) {
    for (const std::string& line : result.lines) {
        std::cout << "  " << line << "\n";
    }
}

/*
 * Program entry point.
 *
 * Flow:
 *   1) Window creation
 *   2) Environment + calendar startup
 *   3) Frame loop: keys -> environment update -> clock invocations -> clear to sky colour
 *   4) Calendar shutdown (state saved), window cleanup
 */
int main(int argc, char** argv) {
    std::string configPath;
    if (argc > 1) {
        configPath = argv[1];
    } else {
        auto assetsRoot = FindAssetsRoot();
        if (assetsRoot.empty()) {
            std::cerr << "Failed to locate assets directory. CWD=" << std::filesystem::current_path() << "\n";
            return -1;
        }
        configPath = (assetsRoot / "config.yml").string();
    }

    if (!glfwInit()) return -1;

    GLFWwindow* window = glfwCreateWindow(1280, 720, "Almanac", nullptr, nullptr);
    if (!window) { glfwTerminate(); return -1; }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // VSync on

    glfwSetFramebufferSizeCallback(window, FramebufferSizeCallback);
    glfwGetFramebufferSize(window, &g_fbW, &g_fbH);
    glViewport(0, 0, g_fbW, g_fbH);

    Input input(window);
    Environment environment;
    WorldActionDispatcher actions(environment.world());
    WindowTitleSink titleSink(window);

    CalendarSystem calendar(configPath, &environment.world(), actions);
    calendar.addListener(&environment.effects());
    calendar.addViewer(&titleSink);
    if (!calendar.startup()) {
        std::cerr << "[Demo] Configuration had errors; running with defaults\n";
    }

    CalendarCommand command(calendar);
    const CommandSender console{"console", true};

    bool sleeping = false;
    double clockAcc = 0.0;
    double lastTime = glfwGetTime();

    while (!glfwWindowShouldClose(window)) {
        double now = glfwGetTime();
        float dt = static_cast<float>(now - lastTime);
        lastTime = now;

        glfwPollEvents();

        if (input.consumePress(GLFW_KEY_ESCAPE)) {
            glfwSetWindowShouldClose(window, GLFW_TRUE);
        }
        if (input.consumePress(GLFW_KEY_B) && !sleeping) {
            if (calendar.handleSleepProgress(1, 1)) {
                environment.world().setCycleSpeed(kSleepCycleSpeed);
                sleeping = true;
            }
        }
        if (input.consumePress(GLFW_KEY_W)) {
            if (calendar.handleWake()) {
                environment.world().setCycleSpeed(1.0);
                sleeping = false;
            } else {
                std::cout << "[Demo] It is not morning yet\n";
            }
        }
        if (input.consumePress(GLFW_KEY_E)) {
            PrintReply(command.execute(console, "event end"));
        }
        if (input.consumePress(GLFW_KEY_R)) {
            PrintReply(command.execute(console, "reload"));
        }
        if (input.consumePress(GLFW_KEY_N)) {
            const int month = calendar.date().month();
            const bool back = input.keyDown(GLFW_KEY_LEFT_SHIFT) || input.keyDown(GLFW_KEY_RIGHT_SHIFT);
            const int target = back ? (month + 10) % 12 + 1 : month % 12 + 1;
            PrintReply(command.execute(console, "set month " + std::to_string(target)));
        }

        environment.update(dt);

        // Sleep ends on its own once the host cycle reaches the morning window.
        if (sleeping && calendar.handleWake()) {
            environment.world().setCycleSpeed(1.0);
            sleeping = false;
        }

        const double interval = calendar.config().intervalSeconds;
        clockAcc += dt;
        while (clockAcc >= interval) {
            calendar.tick();
            clockAcc -= interval;
        }

        glm::vec3 sky = environment.skyColor();
        glClearColor(sky.r, sky.g, sky.b, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        glfwSwapBuffers(window);
    }

    calendar.shutdown();
    calendar.removeViewer(&titleSink);
    calendar.removeListener(&environment.effects());

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
