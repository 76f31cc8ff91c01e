#include "app/NotoxApp.h"

#include <exception>
#include <iostream>
#include <system_error>

int main(int argc, char* argv[]) try {
    std::ios::sync_with_stdio(false);

    notox::NotoxApp app(std::cout, std::cerr);
    return app.run(argc, argv);
}
catch (const std::system_error& se) {
    std::cerr << "notox: error: " << se.code() << " - " << se.what() << "\n";
    return 2;
}
catch (const std::exception& ex) {
    std::cerr << "notox: fatal: " << ex.what() << "\n";
    return 2;
}
