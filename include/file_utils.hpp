#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Подсчёт количества строк в файле (последняя строка без '\n' тоже считается)
std::size_t countLinesInFile(const std::filesystem::path& path);

// Поиск корневой директории проекта (ищет папку tests или файл CMakeLists.txt)
std::filesystem::path findProjectRoot();

// Файлы с расширением ext (без учёта регистра) в директории, по алфавиту
std::vector<std::filesystem::path> findFilesWithExtension(const std::filesystem::path& directory,
                                                          const std::string& ext);

// Текущее время в формате для имени файла: 20261019_153000
std::string getCurrentTimeString();
