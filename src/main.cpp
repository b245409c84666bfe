#include "app.hpp"

int main(int argc, char** argv) {
    return App::run(argc, argv);
}
