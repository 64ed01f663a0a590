#include <iostream>
#include <map>
#include <optional>
#include <string>

#include "oxide/type/option.hpp"

using namespace oxide::type;

// Helper function to print section headers
void printHeader(const std::string& title) {
    std::cout << "\n=================================================="
              << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << "==================================================\n"
              << std::endl;
}

class Settings {
public:
    Settings() {
        values_["port"] = "8080";
        values_["host"] = "localhost";
        values_["retries"] = "three";
    }

    auto get(const std::string& key) const -> Option<std::string> {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return present(it->second);
    }

private:
    std::map<std::string, std::string> values_;
};

auto toNumber(const std::string& text) -> Option<int> {
    if (text.empty() ||
        text.find_first_not_of("0123456789") != std::string::npos) {
        return absent<int>();
    }
    return present(std::stoi(text));
}

int main() {
    Settings settings;

    printHeader("Present and Absent");
    auto host = settings.get("host");
    auto user = settings.get("user");
    std::cout << "host = " << host << std::endl;
    std::cout << "user = " << user << std::endl;
    std::cout << "user.unwrapOr(\"guest\") = " << user.unwrapOr("guest")
              << std::endl;

    printHeader("Chaining");
    for (const std::string key : {"port", "retries", "timeout"}) {
        auto value = settings.get(key)
                         .andThen(toNumber)
                         .filter([](int number) { return number > 0; })
                         .map([](int number) { return number * 2; });
        std::cout << key << " doubled -> " << value << std::endl;
    }

    printHeader("Combining");
    auto primary = settings.get("mirror");
    auto fallback = settings.get("host");
    std::cout << "mirror.or_(host)  = " << primary.or_(fallback) << std::endl;
    std::cout << "mirror.xor_(host) = " << primary.xor_(fallback) << std::endl;
    std::cout << "host.xor_(host)   = " << fallback.xor_(fallback) << std::endl;

    printHeader("Converting to Result");
    auto port = settings.get("port").toResult("port is not configured");
    auto proxy = settings.get("proxy").toResultElse(
        [] { return std::string("proxy is not configured"); });
    std::cout << "port  = " << port << std::endl;
    std::cout << "proxy = " << proxy << std::endl;

    printHeader("Unwrapping");
    try {
        static_cast<void>(user.expect("user must be set"));
    } catch (const oxide::error::UnwrapFailure& e) {
        std::cout << "expect() raised: " << e.getMessage() << std::endl;
    }

    return 0;
}
