#include <libstackfmt/trace.hpp>
#include <iostream>

[[gnu::noinline]] std::string c() {
    auto trace = stackfmt::new_stack_trace({ stackfmt::with_include_pc(false), stackfmt::with_show_full_path(false), stackfmt::with_chunk_separator(" "), stackfmt::with_chunk_indentation("") });
    return trace;
}

[[gnu::noinline]] std::string b() {
    auto trace = c();
    return trace;
}

[[gnu::noinline]] std::string a() {
    auto trace = b();
    return trace;
}

int main() {
    std::cout << a() << '\n';
}
