#include <libstackfmt/address_space.hpp>
#include <libstackfmt/error.hpp>
#include <elfutils/libdw.h>
#include <elfutils/libdwfl.h>
#include <dwarf.h>
#include <unistd.h>
#include <cxxabi.h>
#include <cstdlib>

namespace {
    char* debuginfo_path = nullptr;

    const Dwfl_Callbacks callbacks = {
        dwfl_linux_proc_find_elf,
        dwfl_standard_find_debuginfo,
        nullptr,
        &debuginfo_path,
    };

    [[noreturn]] void send_dwfl_error(const std::string& prefix) {
        stackfmt::error::send(prefix + ": " + dwfl_errmsg(-1));
    }

    std::string demangle(const char* mangled_name) {
        int status = 0;
        std::unique_ptr<char, decltype(&std::free)> demangled(
            abi::__cxa_demangle(mangled_name, nullptr, nullptr, &status),
            std::free);
        if (status == 0 and demangled) {
            return demangled.get();
        }
        return mangled_name;
    }

    // Some producers leave the address ranges off the unit itself, so fall
    // back to the unit owning a subprogram that covers the address.
    Dwarf_Die* compile_unit_containing_address(
        Dwfl_Module* mod, Dwarf_Addr address, Dwarf_Addr& bias) {
        if (auto cu = dwfl_module_addrdie(mod, address, &bias)) return cu;

        Dwarf_Die* cu = nullptr;
        while ((cu = dwfl_module_nextcu(mod, cu, &bias))) {
            Dwarf_Die child;
            if (dwarf_child(cu, &child) != 0) continue;
            do {
                auto tag = dwarf_tag(&child);
                if ((tag == DW_TAG_subprogram or tag == DW_TAG_inlined_subroutine) and
                    dwarf_haspc(&child, address - bias) == 1) {
                    return cu;
                }
            } while (dwarf_siblingof(&child, &child) == 0);
        }
        return nullptr;
    }
}

void stackfmt::address_space::dwfl_deleter::operator()(Dwfl* dwfl) const {
    dwfl_end(dwfl);
}

stackfmt::address_space::address_space() {
    dwfl_.reset(dwfl_begin(&callbacks));
    if (!dwfl_) send_dwfl_error("Could not initialise libdwfl");

    dwfl_report_begin(dwfl_.get());
    if (dwfl_linux_proc_report(dwfl_.get(), getpid()) != 0) {
        send_dwfl_error("Could not report process mappings");
    }
    if (dwfl_report_end(dwfl_.get(), nullptr, nullptr) != 0) {
        send_dwfl_error("Could not finish reporting process mappings");
    }
}

Dwfl_Module* stackfmt::address_space::module_containing_address(
    virt_addr address) const {
    auto mod = dwfl_addrmodule(dwfl_.get(), address.addr());
    if (!mod) return nullptr;

    // Kernel-provided mappings such as [vdso] have no file behind them.
    auto name = dwfl_module_info(mod, nullptr, nullptr, nullptr,
        nullptr, nullptr, nullptr, nullptr);
    if (!name or name[0] == '[') return nullptr;
    return mod;
}

std::optional<std::filesystem::path>
stackfmt::address_space::object_containing_address(virt_addr address) const {
    auto mod = module_containing_address(address);
    if (!mod) return std::nullopt;
    return std::filesystem::path(dwfl_module_info(mod, nullptr, nullptr,
        nullptr, nullptr, nullptr, nullptr, nullptr));
}

std::optional<std::string>
stackfmt::address_space::function_name_at_address(virt_addr address) const {
    auto mod = module_containing_address(address);
    if (!mod) return std::nullopt;

    auto name = dwfl_module_addrname(mod, address.addr());
    if (!name) return std::nullopt;
    return demangle(name);
}

stackfmt::resolved_location
stackfmt::address_space::source_location_at_address(virt_addr address) const {
    auto object = object_containing_address(address);
    if (!object) return {};

    auto mod = module_containing_address(address);
    Dwarf_Addr bias = 0;
    if (auto cu = compile_unit_containing_address(mod, address.addr(), bias)) {
        if (auto line = dwarf_getsrc_die(cu, address.addr() - bias)) {
            int line_number = 0;
            auto file = dwarf_linesrc(line, nullptr, nullptr);
            if (file and dwarf_lineno(line, &line_number) == 0 and line_number > 0) {
                return { std::filesystem::path(file).lexically_normal(),
                    static_cast<std::uint64_t>(line_number) };
            }
        }
    }

    return { *object, 0 };
}
