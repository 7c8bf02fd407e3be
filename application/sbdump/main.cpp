#include <sbdump/app.hpp>

int main(int argc, char **argv) { return sbdump::App{}.run(argc, argv); }
