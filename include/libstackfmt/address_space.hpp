#ifndef STACKFMT_ADDRESS_SPACE_HPP
#define STACKFMT_ADDRESS_SPACE_HPP

#include <libstackfmt/types.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

struct Dwfl;
struct Dwfl_Module;

namespace stackfmt {
    struct resolved_location {
        std::filesystem::path file;
        std::uint64_t line = 0;
    };

    // The objects mapped into the calling process, reported from
    // /proc/self/maps when the address space is created. Symbols and debug
    // info are read lazily through libdwfl.
    class address_space {
    public:
        // Throws stackfmt::error when the process maps cannot be reported.
        address_space();

        address_space(const address_space&) = delete;
        address_space& operator=(const address_space&) = delete;

        std::optional<std::filesystem::path> object_containing_address(
            virt_addr address) const;

        std::optional<std::string> function_name_at_address(
            virt_addr address) const;

        // The source file and line of `address`. Without debug info the
        // containing object is reported with line 0, and an address outside
        // every object yields an empty path.
        resolved_location source_location_at_address(virt_addr address) const;

    private:
        Dwfl_Module* module_containing_address(virt_addr address) const;

        struct dwfl_deleter {
            void operator()(Dwfl* dwfl) const;
        };
        std::unique_ptr<Dwfl, dwfl_deleter> dwfl_;
    };
}

#endif
