#include "app/app.hpp"

int main(int argc, char** argv) {
    app::App application;
    return application.run(argc, argv);
}
