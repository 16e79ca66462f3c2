#ifndef STACKFMT_TYPES_HPP
#define STACKFMT_TYPES_HPP

#include <cstdint>

namespace stackfmt {
    // An address in the running process, as opposed to an offset into one
    // of its mapped objects.
    class virt_addr {
    public:
        virt_addr() = default;
        explicit virt_addr(std::uint64_t addr) : addr_(addr) {}

        std::uint64_t addr() const { return addr_; }

        virt_addr operator+(std::int64_t offset) const {
            return virt_addr(addr_ + offset);
        }
        virt_addr operator-(std::int64_t offset) const {
            return virt_addr(addr_ - offset);
        }

        bool operator==(virt_addr other) const { return addr_ == other.addr_; }
        bool operator!=(virt_addr other) const { return addr_ != other.addr_; }

    private:
        std::uint64_t addr_ = 0;
    };
}

#endif
