#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/Window/Event.hpp>
#include <SFML/Window/Keyboard.hpp>
#include <cstdio>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "config.hpp"
#include "engine.hpp"
#include "log.hpp"
#include "scheduler.hpp"
#include "surface.hpp"
#include "time.hpp"
using namespace sf;

namespace {
class PerformanceReport {
    float m_interval;
    Stopwatch m_clock;
    std::vector<std::map<std::string, float>> m_times;
    bool m_displayed = false;
public:
    explicit PerformanceReport(float interval) : m_interval(interval) {}
    bool enabled() const {
        return m_interval > 0.f;
    }
    void begin(const Config& config) {
        if(!enabled())
            return;
        std::cout << "{\n";
        auto dispNameValue = [&](std::string name, auto value, bool isLast = false) {
            std::cout << "\t\"" << name << "\" : \"" << value << "\"";
            if(!isLast)
                std::cout << ",";
            std::cout << "\n";
        };
        dispNameValue("width", config.width);
        dispNameValue("height", config.height);
        dispNameValue("max particle count", config.params.max_particles);
        dispNameValue("connection distance", config.params.connect_distance);
        std::cout << "\t\"measurements\" : [\n";
    }
    void record(const std::map<std::string, float>& times) {
        if(!enabled() || times.empty())
            return;
        m_times.push_back(times);
        if(m_clock.getElapsedTime() < m_interval)
            return;
        m_clock.restart();
        std::cout << "\t\t";
        if(m_displayed)
            std::cout << ",";
        m_displayed = true;
        std::cout << "{\n";
        auto displayAvg = [&](const std::string& name) {
            float sum = 0.f;
            for(auto& tab : m_times) {
                auto it = tab.find(name);
                if(it != tab.end())
                    sum += it->second;
            }
            std::cout << "\"" << name << "\" : \"" << sum / m_times.size() << "\"";
        };
        for(const auto& [name, val] : m_times.front()) {
            std::cout << "\t\t\t";
            displayAvg(name);
            std::cout << ",\n";
        }
        float sum = 0.f;
        for(const auto& v : m_times) {
            for(const auto& [name, val] : v)
                sum += val;
        }
        float avg = sum / m_times.size();
        std::cout << "\t\t\t\"FPS\" : \"" << (avg > 0.f ? 1.f / avg : 0.f) << "\"\n";
        std::cout << "\t\t}\n";
        m_times.clear();
    }
    void end() {
        if(!enabled())
            return;
        std::cout << "\t]\n}\n";
    }
};
}

int main(int argc, char** argv) {
    Logger::initFromEnv();
    Config config;
    try {
        config = parse_args(argc, argv);
    }catch(const std::exception& e) {
        std::fprintf(stderr, "incorrect arguments were given: %s\n", e.what());
        std::fprintf(stderr, "%s", usage().c_str());
        return 1;
    }
    if(config.show_help) {
        std::printf("%s", usage().c_str());
        return 0;
    }

    try {
        RenderWindow window(VideoMode(config.width, config.height), "particle-net");
        if(!window.isOpen()) {
            Logger::error("could not open a " + std::to_string(config.width) + "x" + std::to_string(config.height) + " window");
            return 1;
        }
        if(config.framerate_limit > 0)
            window.setFramerateLimit(config.framerate_limit);
        else
            window.setVerticalSyncEnabled(true);

        RenderTargetSurface surface(window);
        EventHub events;
        RefreshScheduler scheduler;
        ParticleEngine engine(&surface, config.params);
        engine.setDark(config.dark);
        engine.setAlarming(config.alarming);
        engine.setOnDoubleInteraction([&engine] {
            Logger::info("double interaction, alarm dismissed");
            engine.setAlarming(false);
        });
        if(!engine.start(scheduler, events)) {
            Logger::error("particle engine did not start");
            return 1;
        }

        PerformanceReport report(config.report_interval);
        report.begin(config);
        while (window.isOpen()) {
            Event event;
            while (window.pollEvent(event)) {
                if (event.type == Event::Closed) {
                    window.close();
                    continue;
                }
                if (event.type == Event::KeyPressed) {
                    if(event.key.code == Keyboard::Escape) {
                        window.close();
                        continue;
                    }else if(event.key.code == Keyboard::D) {
                        engine.setDark(!engine.isDark());
                        Logger::info(std::string("dark = ") + (engine.isDark() ? "true" : "false"));
                    }else if(event.key.code == Keyboard::A) {
                        engine.setAlarming(!engine.isAlarming());
                        Logger::info(std::string("alarming = ") + (engine.isAlarming() ? "true" : "false"));
                    }
                }
                events.dispatch(event);
            }
            if(!window.isOpen())
                break;
            if(scheduler.pump() > 0)
                report.record(engine.lastTimings());
            window.display();
        }
        engine.stop();
        report.end();
    }catch(const std::exception& e) {
        Logger::logException("unhandled exception", e);
        return 2;
    }
    return 0;
}
