#include "session_processor.hpp"

#include "calculator.hpp"
#include "console.hpp"
#include "key_parser.hpp"
#include "logger.hpp"

namespace calc {

SessionRecord runSession(std::size_t lineNumber, const std::string& keys) {
    SessionRecord record;
    record.lineNumber = lineNumber;
    record.keys = keys;

    try {
        if (trim(keys).empty()) {
            throw std::runtime_error("Пустая строка");
        }

        Calculator calculator;
        for (const Key& key : KeyParser(keys).parse()) {
            calculator.handle(key);
        }
        record.display = calculator.display();
        record.status = "success";
    }
    catch (const std::exception& ex) {
        Logger::debug("line %zu: %s", lineNumber, ex.what());
        record.display.reset();
        record.status = "error";
        record.message = ex.what();
    }
    return record;
}

} // namespace calc
