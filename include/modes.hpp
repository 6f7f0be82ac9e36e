#pragma once

#include <iosfwd>

namespace calc {

class Calculator;

// Интерактивный режим: строки нажатий из in, дисплей в out.
// Возвращает после EOF или команды выхода.
void runInteractiveMode(std::istream& in, std::ostream& out);

// Рамка с текстом дисплея и ожидающей операцией
void printDisplay(std::ostream& out, const Calculator& calculator);

// Пакетный режим: файл сессий -> CSV
void runBatchMode();

// Режим генерации файла случайных сессий
void runGenerateMode();

} // namespace calc
