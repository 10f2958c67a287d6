#pragma once

#include <iostream>
#include <stdexcept>
#include <string>

namespace sockbridge::core {

    struct ForwarderConfig {
        std::string source;
        std::string target;
        bool verbose = false;
        bool independent_target = false;
        bool show_help = false;
    };

    inline void usage(const char* argv0, std::ostream& out = std::cerr) {
        out <<
            "Usage: " << argv0 << " -source <addr> -target <addr> [-v] [--independent-target]\n"
            "\n"
            "  -source, --source <addr>   listen address: Unix socket path or [host]:port\n"
            "  -target, --target <addr>   dial address: Unix socket path or [host]:port\n"
            "  -v, --verbose              log per-connection details\n"
            "  --independent-target       resolve the target endpoint kind on its own\n"
            "                             instead of reusing the source kind\n"
            "  -h, --help                 show this text\n"
            "\n"
            "An address is treated as a Unix socket path when the source path exists\n"
            "at startup; otherwise both addresses are TCP.\n";
    }

    // Accepts -name value, --name value, -name=value and --name=value.
    inline bool parse_args(int argc, char** argv, ForwarderConfig& cfg) {
        for (int i = 1; i < argc; i++) {
            std::string a = argv[i];
            if (a.size() < 2 || a[0] != '-') return false;

            std::string name = a.substr(a.rfind("--", 0) == 0 ? 2 : 1);
            std::string value;
            bool has_inline_value = false;
            auto eq = name.find('=');
            if (eq != std::string::npos) {
                value = name.substr(eq + 1);
                name.erase(eq);
                has_inline_value = true;
            }

            auto next = [&](std::string& target) {
                if (has_inline_value) { target = value; return true; }
                if (i + 1 >= argc) return false;
                target = argv[++i];
                return true;
            };

            if (name == "source")                 { if (!next(cfg.source)) return false; }
            else if (name == "target")            { if (!next(cfg.target)) return false; }
            else if (name == "verbose" || name == "v") { if (has_inline_value) return false; cfg.verbose = true; }
            else if (name == "independent-target") { if (has_inline_value) return false; cfg.independent_target = true; }
            else if (name == "help" || name == "h") { cfg.show_help = true; }
            else { return false; }
        }
        return true;
    }

    inline void validate(const ForwarderConfig& cfg) {
        if (cfg.source.empty() || cfg.target.empty()) {
            throw std::invalid_argument("Both source and target addresses must be specified");
        }
    }

} // namespace sockbridge::core
