#pragma once

#include <argparse/argparse.hpp>

namespace weft::driver {

auto WeaveCommand(const argparse::ArgumentParser& cmd) -> int;
auto CheckCommand(const argparse::ArgumentParser& cmd) -> int;
auto DumpCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace weft::driver
