#ifndef STACKFMT_STACK_HPP
#define STACKFMT_STACK_HPP

#include <vector>
#include <optional>
#include <string>
#include <filesystem>
#include <libstackfmt/types.hpp>

namespace stackfmt {
    struct stack_frame {
        virt_addr pc;
        std::filesystem::path file;
        std::uint64_t line = 0;
        std::optional<std::string> function;
    };

    class stack {
    public:
        stack() = default;
        explicit stack(std::vector<stack_frame> frames)
            : frames_(std::move(frames)) {}

        // Captures the calling thread's stack. Frame 0 is the function that
        // called unwind().
        [[gnu::noinline]] void unwind();

        std::optional<stack_frame> caller(int depth) const;

        const std::vector<stack_frame>& frames() const { return frames_; }
        std::size_t depth() const { return frames_.size(); }

    private:
        std::vector<stack_frame> frames_;
    };
}

#endif
