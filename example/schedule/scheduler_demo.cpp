#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "cadence/config/config.hpp"
#include "cadence/error/exception.hpp"
#include "cadence/log/logging.hpp"
#include "cadence/schedule/scheduler.hpp"

using namespace cadence;
using namespace std::chrono_literals;

#define SECTION(name) std::cout << "\n=== " << name << " ===\n"

// Stands in for the assistant's command processor.
std::string executeCommand(const std::string& command) {
    if (command == "fail") {
        throw std::runtime_error("command processor unavailable");
    }
    return "executed '" + command + "'";
}

void printJobs(const schedule::TaskScheduler& scheduler) {
    for (const auto& job : scheduler.getJobs()) {
        std::cout << job.toJson().dump(2) << "\n";
    }
}

int main(int argc, char** argv) {
    config::CadenceConfig settings;
    try {
        if (argc > 1) {
            settings = config::CadenceConfig::load(argv[1]);
        }
        settings.applyEnvironment();
        log::initLogging(settings.log);
    } catch (const error::Exception& e) {
        std::cerr << "Invalid configuration: " << e.getMessage() << "\n";
        return 1;
    }

    SECTION("Configuration");
    std::cout << settings.toJson().dump(2) << "\n";

    schedule::TaskScheduler scheduler(settings.scheduler);
    scheduler.setCommandCallback(executeCommand);
    scheduler.start();

    SECTION("Adding jobs");
    scheduler.scheduleOnce("hello", "say hello",
                           std::chrono::system_clock::now() + 1s);
    scheduler.scheduleInterval("heartbeat", "report status", 2s);
    scheduler.scheduleInterval("broken", "fail", 3s);
    scheduler.scheduleDaily("coffee", "make coffee", 7, 0);
    scheduler.scheduleWeekly("bins", "take out the bins", "mon", 19, 30);
    scheduler.scheduleCron("backup", "run backup",
                           schedule::CronSpec::fromCrontab("0 3 * * *"));
    scheduler.scheduleFromText("stretch", "time to stretch", "in 30 minutes");
    if (!scheduler.scheduleFromText("bad", "noop", "at some point")) {
        std::cout << "Rejected unparsable schedule 'at some point'\n";
    }
    printJobs(scheduler);

    SECTION("Running for 7 seconds");
    std::this_thread::sleep_for(7s);
    printJobs(scheduler);

    SECTION("Removing jobs");
    scheduler.removeJob("heartbeat");
    scheduler.removeJob("broken");
    std::cout << scheduler.jobCount() << " jobs left\n";

    scheduler.stop();
    return 0;
}
