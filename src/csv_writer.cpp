#include "csv_writer.hpp"

#include <stdexcept>

namespace calc {

CsvWriter::CsvWriter(std::filesystem::path targetPath) : path(std::move(targetPath)) {
    std::ofstream stream(path, std::ios::trunc);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    stream << "line,keys,status,display,message\n";
}

std::ofstream CsvWriter::openForAppend() const {
    std::ofstream stream(path, std::ios::app);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    return stream;
}

void CsvWriter::writeRecord(const SessionRecord& record) const {
    std::ofstream stream = openForAppend();
    writeRow(stream, record);
}

void CsvWriter::write(const std::vector<SessionRecord>& records) const {
    std::ofstream stream = openForAppend();
    for (const auto& record : records) {
        writeRow(stream, record);
    }
}

// Дисплей пишется как текст, без переформатирования числа
void CsvWriter::writeRow(std::ostream& stream, const SessionRecord& record) {
    stream << record.lineNumber << ','
        << quoteCsv(record.keys) << ','
        << record.status << ',';
    if (record.display.has_value()) {
        stream << quoteCsv(*record.display);
    }
    stream << ',' << quoteCsv(record.message) << '\n';
}

std::string quoteCsv(const std::string& field) {
    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted.push_back('"');
    for (char ch : field) {
        if (ch == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

} // namespace calc
