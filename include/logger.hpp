#pragma once

#include <cstdarg>
#include <cstddef>
#include <optional>
#include <string>

namespace calc {

/*
  Logger — журнал в stderr с уровнями.

  - Форматирование в стиле printf, одна запись = одна строка.
  - Префикс "[sssss.mmm]" — время с момента запуска программы.
  - Запись сериализуется мьютексом, поэтому безопасна из рабочих потоков пакетного режима.
  - Записи ниже текущего уровня отбрасываются до форматирования.
*/
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Warn,
        Error
    };

    static constexpr std::size_t kMaxMsgBytes = 256; // максимальная длина одной записи

    static void setLevel(Level level);
    static Level level();
    static bool enabled(Level level);

    // Разбор имени уровня: debug, info, warn, error (без учета регистра)
    static std::optional<Level> parseLevel(const std::string& name);
    static const char* levelName(Level level);

    static void debug(const char* fmt, ...);
    static void info(const char* fmt, ...);
    static void warn(const char* fmt, ...);
    static void error(const char* fmt, ...);

private:
    static void write(Level level, const char* fmt, va_list ap);
};

} // namespace calc
