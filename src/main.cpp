//! # IRT Tool Entry Point
//!
//! Delegates to the CLI driver (`cli/driver.hpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return irt_main(argc, argv);
}
