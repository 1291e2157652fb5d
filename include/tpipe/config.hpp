/*
 * TPipe Configuration
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Config is the read-only snapshot captured once in main: rc-file defaults
 *   (key=value, `#` comments, booleans 1|true|on) overridden by option flags.
 *   It is passed by const reference into every source, stage and sink.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace tpipe {

struct Config {
    bool nocase = false;   // default for every `nocase` switch
    bool skip_err = false; // skip unreadable input files with a warning
    bool verbose = false;
    bool dry_run = false;
    bool color = true;
};

// $TPIPE_RC, else ~/.tpiperc; empty when neither can be resolved.
std::string default_config_path();

// Missing files are not an error; unknown keys are ignored.
void load_config_file(const std::string& path, Config& cfg);

struct CommandLine {
    Config config;
    bool show_help = false;
    std::string help_topic;
    bool show_version = false;
    std::optional<std::string> eval; // --eval <token>
    std::vector<std::string> pipeline_args;
};

// Options are only recognized before the first pipeline word.
// Throws Error(MissingArg) when --eval has no value and
// Error(UnexpectedRemaining) when --eval is followed by pipeline words.
CommandLine parse_command_line(const std::vector<std::string>& args, Config base);

} // namespace tpipe
