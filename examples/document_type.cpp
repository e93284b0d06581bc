/// @file document_type.cpp
/// @brief Reads a document and reports its "type" member without decoding
/// the rest of it.
///
/// Usage: document_type ['<json text>']

#include <lazyjson/lazyjson.hpp>

#include <iostream>
#include <string>
#include <system_error>
#include <utility>

int main(int argc, char** argv) {
    // bytes as they came off the wire
    std::string bytes = argc > 1 ? argv[1] : R"({"type":"test"})";
    auto value = lazyjson::Value::from_bytes(std::move(bytes));

    if (value->kind() == lazyjson::Kind::NotJson) {
        std::cout << "These bytes are not valid JSON\n";
        return 0;
    }

    try {
        // still a lazy Value: nothing has been decoded yet
        auto type = value->path("type");
        if (type->kind() == lazyjson::Kind::String) {
            std::cout << "The document type was " << type->value()->as_string() << "\n";
        } else {
            std::cout << "The document type is a " << lazyjson::kind_name(type->kind()) << "\n";
        }
    } catch (const lazyjson::Undefined&) {
        std::cout << "type is undefined\n";
    } catch (const std::system_error& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
