#include <iostream>
#include <map>
#include <string>

#include "oxide/log/logging.hpp"
#include "oxide/type/result.hpp"

using namespace oxide::type;

// Helper function to print section headers
void printHeader(const std::string& title) {
    std::cout << "\n=================================================="
              << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << "==================================================\n"
              << std::endl;
}

class User {
public:
    User(int id, std::string name) : id_(id), name_(std::move(name)) {}

    int getId() const { return id_; }
    const std::string& getName() const { return name_; }

    bool operator==(const User& other) const {
        return id_ == other.id_ && name_ == other.name_;
    }

    friend std::ostream& operator<<(std::ostream& os, const User& user) {
        return os << "User{id=" << user.id_ << ", name=\"" << user.name_
                  << "\"}";
    }

private:
    int id_;
    std::string name_;
};

struct DatabaseError {
    int code;
    std::string message;

    bool operator==(const DatabaseError& other) const {
        return code == other.code && message == other.message;
    }

    friend std::ostream& operator<<(std::ostream& os,
                                    const DatabaseError& error) {
        return os << "DatabaseError{" << error.code << ", " << error.message
                  << "}";
    }
};

class UserRepository {
public:
    UserRepository() {
        users_.emplace(1, User(1, "alice"));
        users_.emplace(2, User(2, "bob"));
    }

    auto findUser(int id) const -> Result<User, DatabaseError> {
        auto it = users_.find(id);
        if (it == users_.end()) {
            return failure(DatabaseError{404, "user not found"});
        }
        return success(it->second);
    }

private:
    std::map<int, User> users_;
};

auto parseId(const std::string& text) -> Result<int> {
    if (text.empty() || text.find_first_not_of("0123456789") !=
                            std::string::npos) {
        return failure("invalid id: '" + text + "'");
    }
    return success(std::stoi(text));
}

int main() {
    oxide::log::initLogging();
    UserRepository repository;

    printHeader("Creating results");
    Result<int> ok = success(2);
    Result<int> bad = failure("bad");
    std::cout << "ok  = " << ok << std::endl;
    std::cout << "bad = " << bad << std::endl;

    printHeader("Transforming values");
    std::cout << "ok.map(x * 2).unwrapOr(0)  = "
              << ok.map([](int x) { return x * 2; }).unwrapOr(0) << std::endl;
    std::cout << "bad.map(x * 2).unwrapOr(0) = "
              << bad.map([](int x) { return x * 2; }).unwrapOr(0) << std::endl;

    Result<std::string, int> coded = failure(13);
    std::cout << "mapError -> "
              << coded.mapError([](int code) {
                       return "code:" + std::to_string(code);
                   })
              << std::endl;

    printHeader("Chaining lookups");
    for (const std::string input : {"1", "7", "x"}) {
        auto name =
            parseId(input)
                .andThen([&repository](int id) {
                    return repository.findUser(id).mapError(
                        [](const DatabaseError& error) { return error.message; });
                })
                .map([](const User& user) { return user.getName(); })
                .inspectError([&input](const std::string& error) {
                    std::cout << "  lookup of '" << input
                              << "' failed: " << error << std::endl;
                });
        std::cout << "'" << input << "' -> " << name.unwrapOr("<nobody>")
                  << std::endl;
    }

    printHeader("Recovering from failures");
    auto recovered = repository.findUser(99).orElse(
        [&repository](const DatabaseError&) { return repository.findUser(1); });
    std::cout << "findUser(99).orElse(findUser(1)) = " << recovered
              << std::endl;

    printHeader("Unwrapping");
    try {
        static_cast<void>(bad.expect("a value was required"));
    } catch (const oxide::error::UnwrapFailure& e) {
        std::cout << "expect() raised: " << e.getMessage() << std::endl;
    }
    try {
        static_cast<void>(bad.unwrap());
    } catch (const oxide::error::UnwrapFailure& e) {
        std::cout << "unwrap() raised:\n" << e.what() << std::endl;
    }

    return 0;
}
