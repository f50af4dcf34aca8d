#include "mediavisor_test.hpp"

#include <functional>
#include <iostream>
#include <vector>

std::vector<std::pair<std::string, std::function<void()>>> &mediavisor_tests() {
    static std::vector<std::pair<std::string, std::function<void()>>> _;
    return _;
}
std::vector<std::string> mediavisor_test_failures;

int main() {
    std::cout << "mediavisor_test_main" << std::endl;
    for (auto &[name, f] : mediavisor_tests()) {
        std::cout << "mediavisor_running_test " << name << std::endl;
        try {
            f();
        } catch (std::exception const &e) {
            mediavisor_test_fail("test_exception in ", name, ": ", e.what());
        } catch (...) {
            mediavisor_test_fail("test_exception unknown_exception in ", name);
            throw;
        }
        std::cout << "mediavisor_test_done " << name << std::endl;
    }
    if (!mediavisor_test_failures.empty()) {
        std::cerr << "mediavisor_test_failures " << mediavisor_test_failures.size() << std::endl;
        return 17;
    } else {
        std::cout << "mediavisor_test_main all passed!" << std::endl;
    }
    return 0;
}
