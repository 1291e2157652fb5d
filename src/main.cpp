// TPipe main
#include <tpipe/config.hpp>
#include <tpipe/driver.hpp>
#include <tpipe/error.hpp>
#include <tpipe/help.hpp>
#include <tpipe/util/log.hpp>

#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
#ifdef SIGPIPE
    // a closed stdout surfaces as a write error instead of killing the process
    std::signal(SIGPIPE, SIG_IGN);
#endif
    std::ios::sync_with_stdio(false);
    std::vector<std::string> args(argv + 1, argv + argc);
    try {
        tpipe::Config base;
        tpipe::load_config_file(tpipe::default_config_path(), base);
        tpipe::CommandLine cl = tpipe::parse_command_line(args, base);
        const tpipe::Config& cfg = cl.config;
        tpipe::set_log_color(cfg.color);

        if (cl.show_help) {
            if (!tpipe::print_help(std::cout, cl.help_topic))
                tpipe::log_warn("unknown help topic `" + cl.help_topic + "`");
            return 0;
        }
        if (cl.show_version) { tpipe::print_version(std::cout); return 0; }

        tpipe::PipelineNode node = cl.eval ? tpipe::parse_pipeline_string(*cl.eval)
                                           : tpipe::parse_pipeline_args(cl.pipeline_args);
        if (cfg.verbose) tpipe::log_info(tpipe::describe_pipeline(node));
        if (cfg.dry_run) return 0;

        tpipe::run_pipeline(node, cfg, std::cin, std::cout);
    } catch (const std::exception& ex) {
        tpipe::Error e = tpipe::as_error(ex);
        tpipe::log_error(e.what());
        return e.exit_code();
    }
    return 0;
}
