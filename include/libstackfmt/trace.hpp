#ifndef STACKFMT_TRACE_HPP
#define STACKFMT_TRACE_HPP

#include <initializer_list>
#include <string>
#include <string_view>
#include <libstackfmt/config.hpp>
#include <libstackfmt/stack.hpp>
#include <libstackfmt/source.hpp>

namespace stackfmt {
    inline constexpr std::string_view unknown_placeholder = "???";

    // Reduces a qualified symbol to its bare function or method name:
    // everything up to the last '/' is dropped, middle dots become '.',
    // then everything up to the first '.' is dropped. Demangled C++ names
    // are first turned into a dotted scope path without parameters or ABI
    // tags, so
    // "ns::widget::draw() const" becomes "widget.draw".
    std::string short_function_name(std::string_view qualified_name);

    std::string render_frame(const stack_trace_config& cfg,
        const stack_frame& frame, source_cache& sources);

    // Renders the frames of `frames` from depth cfg.skip_frames outwards.
    std::string render_stack_trace(
        const stack_trace_config& cfg, const stack& frames);

    // Captures and renders the calling thread's stack. Depth 0 is
    // new_stack_trace itself, depth 1 its caller.
    [[gnu::noinline]] std::string new_stack_trace(
        std::initializer_list<stack_trace_option> options = {});
}

#endif
