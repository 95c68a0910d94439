#include <core.h>

int main(int argc, char* argv[]) {
    return synthpp_main(argc, argv);
}
