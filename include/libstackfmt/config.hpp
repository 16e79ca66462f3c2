#ifndef STACKFMT_CONFIG_HPP
#define STACKFMT_CONFIG_HPP

#include <functional>
#include <initializer_list>
#include <string>
#include <vector>

namespace stackfmt {
    struct stack_trace_config {
        int skip_frames = 0;
        bool include_source_code = true;
        bool include_pc = true;
        bool short_func_names = true;
        bool show_full_path = true;
        bool show_line_numbers = true;
        std::string frame_separator = "\n";
        std::string chunk_separator = "\n";
        std::string chunk_indentation = "\t";
    };

    using stack_trace_option = std::function<void(stack_trace_config&)>;

    stack_trace_option with_skip_frames(int skip);
    stack_trace_option with_include_source_code(bool include);
    stack_trace_option with_include_pc(bool include);
    stack_trace_option with_short_func_names(bool short_names);
    stack_trace_option with_show_full_path(bool full);
    stack_trace_option with_show_line_numbers(bool show);
    stack_trace_option with_frame_separator(std::string separator);
    stack_trace_option with_chunk_separator(std::string separator);
    stack_trace_option with_chunk_indentation(std::string indentation);

    // Applies the options in order to the defaults; a later option wins over
    // an earlier one touching the same field.
    stack_trace_config resolve_config(
        std::initializer_list<stack_trace_option> options);
    stack_trace_config resolve_config(
        const std::vector<stack_trace_option>& options);
}

#endif
