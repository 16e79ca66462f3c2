#include <libstackfmt/config.hpp>

stackfmt::stack_trace_option stackfmt::with_skip_frames(int skip) {
    return [=](stack_trace_config& cfg) { cfg.skip_frames = skip; };
}

stackfmt::stack_trace_option stackfmt::with_include_source_code(bool include) {
    return [=](stack_trace_config& cfg) { cfg.include_source_code = include; };
}

stackfmt::stack_trace_option stackfmt::with_include_pc(bool include) {
    return [=](stack_trace_config& cfg) { cfg.include_pc = include; };
}

stackfmt::stack_trace_option stackfmt::with_short_func_names(bool short_names) {
    return [=](stack_trace_config& cfg) { cfg.short_func_names = short_names; };
}

stackfmt::stack_trace_option stackfmt::with_show_full_path(bool full) {
    return [=](stack_trace_config& cfg) { cfg.show_full_path = full; };
}

stackfmt::stack_trace_option stackfmt::with_show_line_numbers(bool show) {
    return [=](stack_trace_config& cfg) { cfg.show_line_numbers = show; };
}

stackfmt::stack_trace_option stackfmt::with_frame_separator(std::string separator) {
    return [separator = std::move(separator)](stack_trace_config& cfg) {
        cfg.frame_separator = separator;
    };
}

stackfmt::stack_trace_option stackfmt::with_chunk_separator(std::string separator) {
    return [separator = std::move(separator)](stack_trace_config& cfg) {
        cfg.chunk_separator = separator;
    };
}

stackfmt::stack_trace_option stackfmt::with_chunk_indentation(std::string indentation) {
    return [indentation = std::move(indentation)](stack_trace_config& cfg) {
        cfg.chunk_indentation = indentation;
    };
}

stackfmt::stack_trace_config stackfmt::resolve_config(
    std::initializer_list<stack_trace_option> options) {
    stack_trace_config cfg;
    for (auto& option : options) {
        if (option) option(cfg);
    }
    return cfg;
}

stackfmt::stack_trace_config stackfmt::resolve_config(
    const std::vector<stack_trace_option>& options) {
    stack_trace_config cfg;
    for (auto& option : options) {
        if (option) option(cfg);
    }
    return cfg;
}
