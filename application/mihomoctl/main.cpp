#include <mihomoctl/app.hpp>

int main(int argc, char **argv) { return mihomoctl::App{}.run(argc, argv); }
