#include <libstackfmt/stack.hpp>
#include <libstackfmt/address_space.hpp>
#include <libstackfmt/error.hpp>
#include <execinfo.h>

void stackfmt::stack::unwind() {
    std::vector<void*> return_addresses(64);
    while (true) {
        auto size = backtrace(return_addresses.data(),
            static_cast<int>(return_addresses.size()));
        if (static_cast<std::size_t>(size) < return_addresses.size()) {
            return_addresses.resize(size);
            break;
        }
        return_addresses.resize(return_addresses.size() * 2);
    }

    frames_.clear();
    std::optional<address_space> space;
    try {
        space.emplace();
    }
    catch (const error&) {
        // Frames keep their pc but resolve nothing.
    }

    // Entry 0 is unwind() itself.
    for (std::size_t i = 1; i < return_addresses.size(); ++i) {
        auto return_address = reinterpret_cast<std::uint64_t>(return_addresses[i]);
        if (return_address == 0) break;

        // Look up the call instruction rather than the one after it.
        auto pc = virt_addr{ return_address - 1 };
        if (!space) {
            frames_.push_back({ pc, {}, 0, std::nullopt });
            continue;
        }
        auto location = space->source_location_at_address(pc);
        frames_.push_back({ pc, std::move(location.file), location.line,
            space->function_name_at_address(pc) });
    }
}

std::optional<stackfmt::stack_frame> stackfmt::stack::caller(int depth) const {
    if (depth < 0 or static_cast<std::size_t>(depth) >= frames_.size()) {
        return std::nullopt;
    }
    return frames_[depth];
}
