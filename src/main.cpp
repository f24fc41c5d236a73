#include <iostream>
#include <string>
#include <vector>
#include "commands.hpp"

static void print_usage() {
    std::cout << "Usage: dosewatch <command> [options]\n\n"
              << "Commands:\n"
              << "  init                        Create ~/.dosewatch and the database\n"
              << "  status                      Show configuration and counts\n"
              << "  med add|list|show|update|remove\n"
              << "                              Manage medications\n"
              << "  schedule add|update|list|enable|disable|remove\n"
              << "                              Manage schedules and their reminders\n"
              << "  time add|update|remove      Manage dose-times\n"
              << "  import FILE                 Create medication, schedule and times from a JSON plan\n"
              << "  log --time ID --status S    Record an intake event\n"
              << "  history --med ID            Show intake history, newest first\n"
              << "  upcoming --med ID           Doses due in the next 24h\n"
              << "  rearm                       Recompute and re-arm every reminder\n"
              << "  serve                       Run the reminder loop\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    try {
        if (cmd == "init") {
            return dosewatch::cmd_init();
        }
        else if (cmd == "status") {
            return dosewatch::cmd_status();
        }
        else if (cmd == "med") {
            return dosewatch::cmd_med(args);
        }
        else if (cmd == "schedule") {
            return dosewatch::cmd_schedule(args);
        }
        else if (cmd == "time") {
            return dosewatch::cmd_time(args);
        }
        else if (cmd == "import") {
            return dosewatch::cmd_import(args);
        }
        else if (cmd == "log") {
            return dosewatch::cmd_log(args);
        }
        else if (cmd == "history") {
            return dosewatch::cmd_history(args);
        }
        else if (cmd == "upcoming") {
            return dosewatch::cmd_upcoming(args);
        }
        else if (cmd == "rearm") {
            return dosewatch::cmd_rearm();
        }
        else if (cmd == "serve") {
            return dosewatch::cmd_serve();
        }
        else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }
        else {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
