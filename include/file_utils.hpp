#pragma once

#include <filesystem>
#include <string>

// Подсчет количества строк в файле (последняя строка без \n тоже считается)
std::size_t countLinesInFile(const std::filesystem::path& path);

// Создаёт каталог вместе с родительскими, если его ещё нет
void ensureDirectory(const std::filesystem::path& directory);

// Получение текущего времени в формате для имени файла
std::string getCurrentTimeString();
