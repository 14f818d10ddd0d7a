#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <optional>
#include <string>

#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

#include <spdlog/spdlog.h>

#include "suf/CommandLineArgs.hpp"
#include "suf/Config.hpp"
#include "suf/Log.hpp"
#include "suf/Sim.hpp"

using namespace suf;

static void glfwErrorCallback(const int code, const char *msg)
{
    spdlog::error("GLFW error ({}): {}", code, msg ? msg : "");
}

int main(const int argc, char **argv)
{
    const CommandLineArgs args = parseCommandLineArgs(argc, argv);
    if (args.showHelp)
    {
        std::fputs(buildCommandLineHelpText("suffugium_viewer").c_str(), stdout);
        return 0;
    }
    if (!args.ok())
    {
        for (const auto &e : args.errors)
            std::fprintf(stderr, "%s\n", e.c_str());
        std::fputs(buildCommandLineHelpText("suffugium_viewer").c_str(), stderr);
        return 2;
    }

    initLogging({}, args.verbose ? spdlog::level::debug : spdlog::level::info);

    Config config;
    try
    {
        config = loadConfig(*args.config);
    }
    catch (const std::exception &e)
    {
        spdlog::critical("cannot load configuration {}: {}", args.config->string(), e.what());
        return 1;
    }

    glfwSetErrorCallback(glfwErrorCallback);

    if (!glfwInit())
    {
        spdlog::critical("Failed to init GLFW");
        return 1;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    const std::string title = "Suffugium - " + config.model.site + " / " + config.model.experiment;
    GLFWwindow       *window = glfwCreateWindow(1400, 900, title.c_str(), nullptr, nullptr);
    if (!window)
    {
        spdlog::critical("Failed to create window");
        glfwTerminate();
        return 1;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress)))
    {
        spdlog::critical("Failed to init GLAD");
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    // ===== ImGui init =====
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO &io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    const auto shutdown = [&]
    {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
    };

    // ===== Sim =====
    uint64_t seed = args.seed;
    auto     sim  = [&]
    {
        try
        {
            Sim s = Sim::fromConfig(config, seed);
            s.seedInitial();
            return std::optional<Sim>(std::move(s));
        }
        catch (const std::exception &e)
        {
            spdlog::critical("cannot build simulation: {}", e.what());
            return std::optional<Sim>();
        }
    }();
    if (!sim)
    {
        shutdown();
        return 1;
    }

    // ===== UI / runtime flags =====
    bool paused   = true;
    bool stepOnce = false;
    bool showUI   = true;
    bool finished = false;

    int ticksPerSecond = 24;

    uint64_t selectedId = 0;

    // rolling history
    static constexpr int HISTORY = 480;
    static float         histPop[HISTORY]{};
    static float         histBody[HISTORY]{};
    static float         histOpen[HISTORY]{};
    static float         histBurrow[HISTORY]{};
    static int           histHead = 0;

    auto pushHist = [&](const Sim::RuntimeStats &s)
    {
        histPop[histHead]  = static_cast<float>(s.organisms);
        histBody[histHead] = static_cast<float>(s.meanBodyTemperature);
        if (const auto &ctx = sim->lastContext())
        {
            histOpen[histHead]   = static_cast<float>(ctx->openTemperature);
            histBurrow[histHead] = static_cast<float>(ctx->burrowTemperature);
        }
        histHead = (histHead + 1) % HISTORY;
    };

    auto clearHist = [&]
    {
        std::fill(std::begin(histPop), std::end(histPop), 0.f);
        std::fill(std::begin(histBody), std::end(histBody), 0.f);
        std::fill(std::begin(histOpen), std::end(histOpen), 0.f);
        std::fill(std::begin(histBurrow), std::end(histBurrow), 0.f);
        histHead = 0;
    };

    // edge-triggered input helpers
    auto keyPressedOnce = [&](const int key) -> bool
    {
        static bool prev[512]{};
        const bool  cur = glfwGetKey(window, key) == GLFW_PRESS;
        const bool  out = cur && !prev[key];
        prev[key]       = cur;
        return out;
    };

    auto advance = [&]
    {
        if (finished)
            return;
        try
        {
            if (!sim->step())
            {
                finished = true;
                spdlog::info("simulation finished after {} steps", sim->currentStep());
                return;
            }
            pushHist(sim->computeStats());
        }
        catch (const std::exception &e)
        {
            spdlog::critical("step {} failed: {}", sim->currentStep(), e.what());
            finished = true;
        }
    };

    // fixed step timing
    double lastTime = glfwGetTime();
    double accum    = 0.0;

    while (!glfwWindowShouldClose(window))
    {
        glfwPollEvents();

        // ---- global exit
        if (glfwGetKey(window, GLFW_KEY_ESCAPE) == GLFW_PRESS)
            glfwSetWindowShouldClose(window, 1);

        // ---- edge-triggered toggles
        if (keyPressedOnce(GLFW_KEY_F1))
            showUI = !showUI;
        if (keyPressedOnce(GLFW_KEY_SPACE))
            paused = !paused;
        if (keyPressedOnce(GLFW_KEY_S))
            stepOnce = true;

        // ---- fixed step
        const double now   = glfwGetTime();
        const double frame = now - lastTime;
        lastTime           = now;
        const double fixedDt = 1.0 / std::max(1, ticksPerSecond);

        if (stepOnce)
        {
            advance();
            stepOnce = false;
        }
        else if (!paused)
        {
            constexpr int maxSubSteps = 8;
            int           steps       = 0;

            accum += frame;
            while (accum >= fixedDt && steps < maxSubSteps)
            {
                advance();
                accum -= fixedDt;
                steps++;
            }
            if (steps == maxSubSteps)
                accum = 0.0;
        }

        int w, h;
        glfwGetFramebufferSize(window, &w, &h);
        glViewport(0, 0, w, h);
        glClearColor(0.02f, 0.02f, 0.03f, 1.f);
        glClear(GL_COLOR_BUFFER_BIT);

        // ---- UI
        if (showUI)
        {
            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            ImGui::Begin("Suffugium");

            ImGui::Text("F1 toggle UI | SPACE pause | S step");
            ImGui::Separator();

            if (ImGui::Button(paused ? "Run" : "Pause"))
                paused = !paused;
            ImGui::SameLine();
            if (ImGui::Button("Step"))
                stepOnce = true;
            ImGui::SameLine();
            if (ImGui::Button("Reset"))
            {
                sim->reset(seed);
                sim->seedInitial();
                finished   = false;
                selectedId = 0;
                clearHist();
            }

            ImGui::InputScalar("Seed", ImGuiDataType_U64, &seed);
            ImGui::SliderInt("Ticks / second", &ticksPerSecond, 1, 240);

            ImGui::Separator();

            if (const auto &ctx = sim->lastContext())
            {
                ImGui::Text("Step %d  %04d-%02d-%02d %02d:00  (%s)", ctx->step, ctx->year, ctx->month, ctx->day,
                            ctx->hour, std::string(toString(seasonOf(ctx->month))).c_str());
                ImGui::Text("Open %.2f C  Burrow %.2f C", ctx->openTemperature, ctx->burrowTemperature);
            }
            else
            {
                ImGui::Text("Step 0 of %zu", sim->landscape().stepCount());
            }
            if (finished)
                ImGui::TextColored(ImVec4(1.f, 0.6f, 0.3f, 1.f), "Finished");

            const auto stats = sim->computeStats();
            ImGui::Text("Alive: %d  Active: %d", stats.organisms, stats.active);
            ImGui::Text("Mean body temperature: %.2f C", stats.meanBodyTemperature);
            ImGui::Text("Mean metabolic state: %.2f kcal", stats.meanMetabolicState);

            static float popPlot[HISTORY];
            static float bodyPlot[HISTORY];
            static float openPlot[HISTORY];
            static float burrowPlot[HISTORY];
            for (int i = 0; i < HISTORY; ++i)
            {
                const int idx = (histHead + i) % HISTORY;
                popPlot[i]    = histPop[idx];
                bodyPlot[i]   = histBody[idx];
                openPlot[i]   = histOpen[idx];
                burrowPlot[i] = histBurrow[idx];
            }

            const auto popMax = static_cast<float>(std::max(1, config.model.rattlesnakeCount));
            ImGui::PlotLines("Population", popPlot, HISTORY, 0, nullptr, 0.f, popMax, ImVec2(0, 70));
            ImGui::PlotLines("Body T", bodyPlot, HISTORY, 0, nullptr, -10.f, 50.f, ImVec2(0, 70));
            ImGui::PlotLines("Open T", openPlot, HISTORY, 0, nullptr, -10.f, 60.f, ImVec2(0, 70));
            ImGui::PlotLines("Burrow T", burrowPlot, HISTORY, 0, nullptr, -10.f, 60.f, ImVec2(0, 70));

            ImGui::Separator();
            ImGui::Text("Behavior distribution:");
            for (size_t k = 0; k < kBehaviorCount; ++k)
                ImGui::Text("  %-15s %d", std::string(toString(static_cast<Behavior>(k))).c_str(),
                            stats.behaviorCounts[k]);
            ImGui::Text("Microhabitat distribution:");
            for (size_t k = 0; k < kMicrohabitatCount; ++k)
                ImGui::Text("  %-15s %d", std::string(toString(static_cast<Microhabitat>(k))).c_str(),
                            stats.microhabitatCounts[k]);
            ImGui::Text("Deaths:");
            for (const auto &[cause, n] : sim->deathsByCause())
                ImGui::Text("  %-15s %d", std::string(toString(cause)).c_str(), n);

            ImGui::End();

            ImGui::Begin("Organisms");
            if (ImGui::BeginChild("list", ImVec2(170, 0), true))
            {
                for (const auto &o : sim->organisms())
                {
                    const std::string label = "#" + std::to_string(o.id()) + (o.alive() ? "" : " (dead)");
                    if (ImGui::Selectable(label.c_str(), o.id() == selectedId))
                        selectedId = o.id();
                }
            }
            ImGui::EndChild();
            ImGui::SameLine();

            ImGui::BeginGroup();
            const auto &orgs = sim->organisms();
            const auto  it   = std::ranges::find_if(orgs, [&](const Organism &o)
            {
                return o.id() == selectedId;
            });
            if (it != orgs.end())
            {
                const Organism &o = *it;
                ImGui::Text("Selected: #%llu", static_cast<unsigned long long>(o.id()));
                ImGui::Text("Mass: %.1f g  Age: %d ticks", o.mass(), o.age());
                ImGui::Text("Behavior: %s", std::string(toString(o.behavior())).c_str());
                ImGui::Text("Microhabitat: %s", std::string(toString(o.microhabitat())).c_str());
                ImGui::Text("Active: %s", o.active() ? "yes" : "no");
                ImGui::Text("Body T: %.2f C  T_env: %.2f C", o.bodyTemperature(), o.tEnv());
                ImGui::Text("Thermal accuracy: %.2f  quality: %.2f", o.thermalAccuracy(), o.thermalQuality());
                ImGui::Text("Metabolic state: %.2f / %.2f", o.metabolism().metabolicState(),
                            o.metabolism().maxMetabolicState());
                ImGui::Text("CT counter: %d  Search counter: %d", o.ctOutOfBoundsCounter(),
                            o.behaviorModule().searchCounter());
                ImGui::Text("Attack rate: %.3f  Prey density: %.0f", o.behaviorModule().attackRate(),
                            o.behaviorModule().params().preyDensity);
                ImGui::Text("Prey consumed: %d total", o.totalPreyConsumed());
                if (const auto cause = o.causeOfDeath())
                    ImGui::Text("Cause of death: %s", std::string(toString(*cause)).c_str());

                const auto &ctx = sim->lastContext();
                if (ctx && o.alive() && ImGui::TreeNode("Utilities"))
                {
                    const auto u = o.behaviorModule().computeUtilities(o, *ctx);
                    const auto p = o.behaviorModule().behavioralWeights(o, *ctx);
                    ImGui::Text("Rest           %.3f  p=%.3f", u.rest, p[0]);
                    ImGui::Text("Thermoregulate %.3f  p=%.3f", u.thermoregulate, p[1]);
                    ImGui::Text("Forage         %.3f  p=%.3f", u.forage, p[2]);
                    ImGui::TreePop();
                }
            }
            else
            {
                ImGui::Text("Selected: none (pick an organism)");
            }
            ImGui::EndGroup();
            ImGui::End();

            ImGui::Render();
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        }

        // swap LAST
        glfwSwapBuffers(window);
    }

    shutdown();
    return 0;
}
