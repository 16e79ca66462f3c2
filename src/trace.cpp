#include <libstackfmt/trace.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <vector>

namespace {
    constexpr std::string_view middle_dot = "\xC2\xB7";

    bool ends_with(std::string_view str, std::string_view suffix) {
        return str.size() >= suffix.size() and
            str.substr(str.size() - suffix.size()) == suffix;
    }

    std::string_view strip_clone_suffix(std::string_view name) {
        while (ends_with(name, "]")) {
            auto clone = name.rfind(" [clone ");
            if (clone == std::string_view::npos) break;
            name = name.substr(0, clone);
        }
        return name;
    }

    // "f[abi:cxx11]()" -> "f()"
    std::string strip_abi_tags(std::string_view name) {
        std::string out;
        for (auto tag = name.find("[abi:"); tag != std::string_view::npos;
            tag = name.find("[abi:")) {
            auto close = name.find(']', tag);
            if (close == std::string_view::npos) break;
            out += name.substr(0, tag);
            name.remove_prefix(close + 1);
        }
        out += name;
        return out;
    }

    std::string_view strip_parameters(std::string_view name) {
        auto close = name.rfind(')');
        if (close == std::string_view::npos) return name;

        auto qualifiers = name.substr(close + 1);
        while (true) {
            auto word_start = qualifiers.find_first_not_of(' ');
            if (word_start == std::string_view::npos) break;
            qualifiers.remove_prefix(word_start);

            auto matched = false;
            for (std::string_view word : { "const", "volatile", "noexcept", "&&", "&" }) {
                if (qualifiers.substr(0, word.size()) == word) {
                    qualifiers.remove_prefix(word.size());
                    matched = true;
                    break;
                }
            }
            if (!matched) return name;
        }

        int depth = 0;
        for (auto i = close + 1; i-- > 0;) {
            if (name[i] == ')') ++depth;
            else if (name[i] == '(' and --depth == 0) {
                return name.substr(0, i);
            }
        }
        return name;
    }

    bool is_open(char c) { return c == '<' or c == '(' or c == '{' or c == '['; }
    bool is_close(char c) { return c == '>' or c == ')' or c == '}' or c == ']'; }

    // "int ns::f<int>" -> "ns::f<int>"; spaces inside brackets and the one
    // in "operator new" are not separators.
    std::string_view strip_return_type(std::string_view name) {
        int depth = 0;
        std::size_t start = 0;
        for (std::size_t i = 0; i < name.size(); ++i) {
            if (is_open(name[i])) ++depth;
            else if (is_close(name[i]) and depth > 0) --depth;
            else if (name[i] == ' ' and depth == 0 and
                !ends_with(name.substr(0, i), "operator")) {
                start = i + 1;
            }
        }
        return name.substr(start);
    }

    std::string dotted_scope_path(std::string_view name) {
        std::string path;
        int depth = 0;
        for (std::size_t i = 0; i < name.size(); ++i) {
            if (is_open(name[i])) ++depth;
            else if (is_close(name[i]) and depth > 0) --depth;

            if (depth == 0 and name.substr(i, 2) == "::") {
                path += '.';
                ++i;
                continue;
            }
            path += name[i];
        }
        return path;
    }

    bool looks_like_cxx_name(std::string_view name) {
        return name.find("::") != std::string_view::npos or
            ends_with(name, ")") or ends_with(name, "]") or
            ends_with(name, " const");
    }
}

std::string stackfmt::short_function_name(std::string_view qualified_name) {
    std::string name(qualified_name);
    if (looks_like_cxx_name(qualified_name)) {
        auto untagged = strip_abi_tags(strip_clone_suffix(qualified_name));
        std::string_view reduced = untagged;
        reduced = strip_parameters(reduced);
        reduced = strip_return_type(reduced);
        name = dotted_scope_path(reduced);
    }

    if (auto last_slash = name.rfind('/'); last_slash != std::string::npos) {
        name.erase(0, last_slash + 1);
    }
    for (auto pos = name.find(middle_dot); pos != std::string::npos;
        pos = name.find(middle_dot, pos + 1)) {
        name.replace(pos, middle_dot.size(), ".");
    }
    if (auto period = name.find('.'); period != std::string::npos) {
        name.erase(0, period + 1);
    }
    return name;
}

std::string stackfmt::render_frame(const stack_trace_config& cfg,
    const stack_frame& frame, source_cache& sources) {
    auto display_file = cfg.show_full_path
        ? frame.file.string()
        : frame.file.filename().string();
    if (frame.file.empty()) {
        display_file = unknown_placeholder;
    }

    auto header = display_file;
    if (cfg.show_line_numbers) {
        header += fmt::format(":{}", frame.line);
    }
    if (cfg.include_pc) {
        header += fmt::format(" (0x{:x})", frame.pc.addr());
    }

    std::string name(unknown_placeholder);
    if (frame.function) {
        name = cfg.short_func_names
            ? short_function_name(*frame.function)
            : *frame.function;
    }

    std::string body;
    if (cfg.include_source_code) {
        auto code = sources.line(frame.file, static_cast<std::int64_t>(frame.line));
        body = fmt::format("{}{}: {}", cfg.chunk_indentation, name,
            code ? *code : std::string(unknown_placeholder));
    }
    else {
        body = fmt::format("{}{}", cfg.chunk_indentation, name);
    }

    return header + cfg.chunk_separator + body;
}

std::string stackfmt::render_stack_trace(
    const stack_trace_config& cfg, const stack& frames) {
    source_cache sources;
    std::vector<std::string> rendered;
    for (auto depth = cfg.skip_frames; ; ++depth) {
        auto frame = frames.caller(depth);
        if (!frame) break;
        rendered.push_back(render_frame(cfg, *frame, sources));
    }
    return fmt::format("{}", fmt::join(rendered, cfg.frame_separator));
}

std::string stackfmt::new_stack_trace(
    std::initializer_list<stack_trace_option> options) {
    auto cfg = resolve_config(options);
    stack frames;
    frames.unwind();
    return render_stack_trace(cfg, frames);
}
