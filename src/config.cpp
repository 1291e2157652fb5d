/*
 * TPipe Configuration Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/config.hpp>
#include <tpipe/error.hpp>
#include <tpipe/util/text.hpp>
#include <cstdlib>
#include <fstream>

namespace tpipe {

static std::string getenv_or(const char* k, const std::string& def = "") { const char* v = std::getenv(k); return v ? std::string(v) : def; }
static bool truthy(const std::string& v) { return v == "1" || v == "true" || v == "on"; }

std::string default_config_path() {
    std::string rc = getenv_or("TPIPE_RC"); if (!rc.empty()) return rc;
    std::string home = getenv_or("HOME"); if (home.empty()) return "";
    return home + "/.tpiperc";
}

void load_config_file(const std::string& path, Config& cfg) {
    if (path.empty()) return;
    std::ifstream in(path); if (!in) return;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('='); if (eq == std::string::npos) continue;
        std::string key(text::trim_ws(std::string_view(line).substr(0, eq)));
        std::string val(text::trim_ws(std::string_view(line).substr(eq + 1)));
        if (key == "nocase") cfg.nocase = truthy(val);
        else if (key == "skip_err") cfg.skip_err = truthy(val);
        else if (key == "verbose") cfg.verbose = truthy(val);
        else if (key == "color") cfg.color = truthy(val);
    }
}

CommandLine parse_command_line(const std::vector<std::string>& args, Config base) {
    CommandLine cl; cl.config = base;
    std::size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a.size() < 2 || a[0] != '-') break;
        if (a == "-h" || a == "--help") {
            cl.show_help = true;
            if (i + 1 < args.size() && args[i+1][0] != '-' && args[i+1][0] != ':') cl.help_topic = args[i+1];
            return cl;
        }
        if (a == "-V" || a == "--version") { cl.show_version = true; return cl; }
        if (a == "-v" || a == "--verbose") cl.config.verbose = true;
        else if (a == "-d" || a == "--dry-run") cl.config.dry_run = true;
        else if (a == "-n" || a == "--nocase") cl.config.nocase = true;
        else if (a == "-s" || a == "--skip-err") cl.config.skip_err = true;
        else if (a == "-e" || a == "--eval") {
            if (i + 1 >= args.size()) throw missing_arg(a, "token");
            cl.eval = args[++i];
        }
        else throw Error(ErrorCode::UnexpectedRemaining, "Unknown option `" + a + "`");
    }
    cl.pipeline_args.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    if (cl.eval && !cl.pipeline_args.empty())
        throw Error(ErrorCode::UnexpectedRemaining, "Unexpected arguments after --eval: " + cl.pipeline_args.front());
    return cl;
}

} // namespace tpipe
