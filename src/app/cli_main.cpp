// src/app/cli_main.cpp
#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/select.h>
#include <unistd.h>

#include "client/UaiClient.hpp"
#include "protocol/exceptions/ClientException.h"
#include "spdlog/spdlog.h"

using namespace uai::client;
using uai::protocol::ClientException;

static std::atomic<bool> g_stop{false};

void sigint_handler(int /*signum*/) {
    g_stop.store(true);
}

static std::vector<std::string> split_ws(const std::string& s) {
    std::istringstream iss(s);
    std::vector<std::string> out;
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

static void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [-v] <host> <user> <password> [port]\n";
}

static void print_help() {
    std::cout << "Commands:\n"
              << "  help                     : show this help\n"
              << "  info <target>            : target name and type\n"
              << "  pos <target>             : target position (0 open .. 100 closed)\n"
              << "  groups <target>          : groups the target belongs to\n"
              << "  group <group>            : group name\n"
              << "  up|down|stop <target>    : move up / down / stop\n"
              << "  to <target> <pos>        : move to absolute position\n"
              << "  ip <target> <n>          : move to intermediate position n\n"
              << "  ipnext|ipprev <target>   : next / previous intermediate position\n"
              << "  reconnect                : drop and re-establish the session\n"
              << "  quit                     : exit CLI\n";
}

// returns false if the command was not recognized or arguments are missing
static bool run_command(UaiClient& client, const std::vector<std::string>& toks) {
    const std::string& cmd = toks[0];
    const std::size_t argc = toks.size() - 1;

    if (cmd == "info" && argc >= 1) {
        auto info = client.getTargetInfo(toks[1]);
        std::cout << toks[1] << ": name=\"" << info.name << "\" type=" << info.type << "\n";
    } else if (cmd == "pos" && argc >= 1) {
        std::cout << toks[1] << ": position=" << client.getTargetPosition(toks[1]) << "\n";
    } else if (cmd == "groups" && argc >= 1) {
        auto groups = client.getGroupsForTarget(toks[1]);
        std::cout << toks[1] << ": groups=[";
        for (std::size_t i = 0; i < groups.size(); ++i) {
            if (i) std::cout << ",";
            std::cout << groups[i];
        }
        std::cout << "]\n";
    } else if (cmd == "group" && argc >= 1) {
        std::cout << toks[1] << ": name=\"" << client.getGroupInfo(toks[1]).name << "\"\n";
    } else if (cmd == "up" && argc >= 1) {
        client.moveUp(toks[1]);
    } else if (cmd == "down" && argc >= 1) {
        client.moveDown(toks[1]);
    } else if (cmd == "stop" && argc >= 1) {
        client.stop(toks[1]);
    } else if (cmd == "to" && argc >= 2) {
        client.moveTo(toks[1], std::stoi(toks[2]));
    } else if (cmd == "ip" && argc >= 2) {
        client.moveToIntermediatePosition(toks[1], std::stoi(toks[2]));
    } else if (cmd == "ipnext" && argc >= 1) {
        client.moveToNextIntermediatePosition(toks[1]);
    } else if (cmd == "ipprev" && argc >= 1) {
        client.moveToPreviousIntermediatePosition(toks[1]);
    } else if (cmd == "reconnect") {
        client.disconnect();
        client.connect();
        std::cout << "[CLI] reconnected\n";
    } else {
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    std::vector<std::string> args;
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v" || a == "--verbose") verbose = true;
        else args.push_back(a);
    }
    if (args.size() < 3) {
        print_usage(argv[0]);
        return 2;
    }

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    uai::config::ConnectionSettings settings;
    settings.host = args[0];
    settings.user = args[1];
    settings.password = args[2];
    if (args.size() >= 4) {
        try {
            settings.port = static_cast<std::uint16_t>(std::stoi(args[3]));
        } catch (const std::exception&) {
            std::cerr << "[CLI] invalid port: " << args[3] << "\n";
            return 2;
        }
    }

    UaiClient client(
        settings,
        []() { spdlog::info("UAI+ session ready"); },
        [](std::exception_ptr cause) {
            spdlog::warn("UAI+ session ended: {}", uai::protocol::describe(cause));
        });

    std::signal(SIGINT, sigint_handler);

    std::cout << "[CLI] Connecting to " << settings.host << ":" << settings.port << " ...\n";
    try {
        client.connect();
    } catch (const ClientException& e) {
        std::cerr << "[CLI] " << e.what() << "\n";
        client.disconnect();
        return 1;
    }

    std::cout << "uai-telnet CLI\n";
    std::cout << "Type 'help' for commands.\n";

    // select() with a short timeout so Ctrl+C is noticed while idle
    const int STDIN_FD = fileno(stdin);
    std::string line;
    while (!g_stop.load()) {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(STDIN_FD, &readfds);

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 200000; // 200 ms

        int rv = select(STDIN_FD + 1, &readfds, NULL, NULL, &tv);
        if (rv <= 0) continue;
        if (!FD_ISSET(STDIN_FD, &readfds)) continue;

        if (!std::getline(std::cin, line)) break;
        auto toks = split_ws(line);
        if (toks.empty()) continue;

        if (toks[0] == "help") {
            print_help();
            continue;
        }
        if (toks[0] == "quit" || toks[0] == "exit") {
            std::cout << "[CLI] quitting...\n";
            break;
        }

        try {
            if (!run_command(client, toks)) {
                std::cerr << "[CLI] unknown command or missing argument: " << line << " (type 'help')\n";
            }
        } catch (const ClientException& e) {
            std::cerr << "[CLI] " << e.what() << "\n";
        } catch (const std::invalid_argument& e) {
            std::cerr << "[CLI] invalid number: " << e.what() << "\n";
        } catch (const std::out_of_range& e) {
            std::cerr << "[CLI] number out of range: " << e.what() << "\n";
        }
    }

    client.disconnect();
    std::cout << "[CLI] exited\n";
    return 0;
}
