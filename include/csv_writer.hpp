#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace calc {

// Результат воспроизведения одной строки нажатий
struct SessionRecord {
    std::size_t lineNumber = 0;        // Номер строки в исходном файле
    std::string keys;                  // Исходный текст нажатий
    std::optional<std::string> display; // Итоговый текст дисплея (если сессия выполнена)
    std::string status;                // success или error
    std::string message;               // Сообщение об ошибке (если есть)
};

// Запись результатов в CSV: line,keys,status,display,message
class CsvWriter {
public:
    // Открывает файл с перезаписью и записывает заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    // Дописывает пакет результатов
    void write(const std::vector<SessionRecord>& records) const;

    // Дописывает один результат (потоковая запись)
    void writeRecord(const SessionRecord& record) const;

    const std::filesystem::path& target() const { return path; }

private:
    std::filesystem::path path;

    std::ofstream openForAppend() const;
    static void writeRow(std::ostream& stream, const SessionRecord& record);
};

// Экранирование поля CSV: поле в кавычках, кавычки удваиваются
std::string quoteCsv(const std::string& field);

} // namespace calc
