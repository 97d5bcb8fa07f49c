#include "options.hpp"

#include <cctype>
#include <limits>
#include <thread>

namespace exprcc {

namespace {
// Возвращает значение параметра, стоящее следом за ним
const std::string& requireValue(const std::vector<std::string>& args, std::size_t& i) {
    if (i + 1 >= args.size()) {
        throw UsageError("Параметр " + args[i] + " требует значения");
    }
    return args[++i];
}

std::uint32_t parseSeed(const std::string& value) {
    try {
        std::size_t consumed = 0;
        unsigned long long result = std::stoull(value, &consumed);
        if (consumed != value.size() || result > std::numeric_limits<std::uint32_t>::max()) {
            throw UsageError("");
        }
        return static_cast<std::uint32_t>(result);
    }
    catch (const std::exception&) {
        throw UsageError("Некорректное значение --seed: " + value);
    }
}

double parseProbability(const std::string& value) {
    double result = 0.0;
    try {
        std::size_t consumed = 0;
        result = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw UsageError("");
        }
    }
    catch (const std::exception&) {
        throw UsageError("Некорректное значение --errors: " + value);
    }
    if (result < 0.0 || result > 1.0) {
        throw UsageError("Значение --errors должно быть в диапазоне [0; 1]");
    }
    return result;
}

std::size_t defaultThreadCount() {
    unsigned count = std::thread::hardware_concurrency();
    return count == 0 ? 1 : count;
}

// "--tokens" это параметр, а "--5" и "--(1)" это выражения с двойным унарным минусом
bool isLongOption(const std::string& arg) {
    return arg.size() > 2 && arg.rfind("--", 0) == 0 &&
           std::isalpha(static_cast<unsigned char>(arg[2]));
}

void parseBatch(const std::vector<std::string>& args, Options& options) {
    options.mode = Mode::Batch;
    options.threadCount = defaultThreadCount();

    std::vector<std::string> positional;
    for (std::size_t i = 1; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "-o") {
            options.reportPath = requireValue(args, i);
        } else if (arg == "-d") {
            options.listingsDir = requireValue(args, i);
        } else if (arg == "-j") {
            options.threadCount = parseNumber(requireValue(args, i));
        } else if (isLongOption(arg) || (arg.size() > 1 && arg[0] == '-')) {
            throw UsageError("Неизвестный параметр batch: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 1) {
        throw UsageError("batch ожидает ровно один входной файл");
    }
    options.inputPath = positional.front();
}

void parseGenerate(const std::vector<std::string>& args, Options& options) {
    options.mode = Mode::Generate;

    std::vector<std::string> positional;
    for (std::size_t i = 1; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--seed") {
            options.seed = parseSeed(requireValue(args, i));
        } else if (arg == "--depth") {
            options.maxDepth = parseNumber(requireValue(args, i));
            if (options.maxDepth > kMaxGeneratorDepth) {
                throw UsageError("Значение --depth не больше " + std::to_string(kMaxGeneratorDepth));
            }
        } else if (arg == "--errors") {
            options.errorProbability = parseProbability(requireValue(args, i));
        } else if (isLongOption(arg)) {
            throw UsageError("Неизвестный параметр generate: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        throw UsageError("generate ожидает количество выражений и имя выходного файла");
    }
    options.expressionCount = parseNumber(positional[0]);
    options.generatedPath = positional[1];
}
}

std::size_t parseNumber(const std::string& value) {
    std::size_t result = 0;
    try {
        std::size_t consumed = 0;
        result = std::stoul(value, &consumed);
        // stoul молча принимает "-5" и переводит его в огромное число
        if (consumed != value.size() || value.find('-') != std::string::npos) {
            throw UsageError("");
        }
    }
    catch (const std::exception&) {
        throw UsageError("Некорректное числовое значение: " + value);
    }
    if (result == 0) {
        throw UsageError("Число должно быть положительным");
    }
    return result;
}

Options parseOptions(const std::vector<std::string>& args) {
    Options options;
    if (args.empty()) {
        throw UsageError("Не задано выражение");
    }
    if (args.front() == "batch") {
        parseBatch(args, options);
        return options;
    }
    if (args.front() == "generate") {
        parseGenerate(args, options);
        return options;
    }

    std::vector<std::string> positional;
    bool optionsEnded = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (optionsEnded) {
            positional.push_back(arg);
        } else if (arg == "--") {
            optionsEnded = true;
        } else if (arg == "-h" || arg == "--help") {
            options.mode = Mode::Help;
            return options;
        } else if (arg == "-o") {
            options.outputPath = requireValue(args, i);
        } else if (arg == "--tokens") {
            options.mode = Mode::Tokens;
        } else if (arg == "--ast") {
            options.mode = Mode::Ast;
        } else if (arg == "--eval") {
            options.mode = Mode::Eval;
        } else if (isLongOption(arg)) {
            throw UsageError("Неизвестный параметр: " + arg);
        } else {
            // "-5" и подобные строки считаются выражением, а не параметром
            positional.push_back(arg);
        }
    }

    if (positional.size() != 1) {
        throw UsageError("Ожидается ровно одно выражение, получено " + std::to_string(positional.size()));
    }
    if (options.outputPath.has_value() && options.mode != Mode::Compile) {
        throw UsageError("Параметр -o применим только при компиляции");
    }
    options.expression = positional.front();
    return options;
}

std::string usageText(std::string_view programName) {
    std::string name(programName);
    return "Использование:\n"
           "  " + name + " [-o <файл>] <выражение>     компиляция в ассемблер x86-64\n"
           "  " + name + " --tokens <выражение>        вывод токенов\n"
           "  " + name + " --ast <выражение>           вывод синтаксического дерева\n"
           "  " + name + " --eval <выражение>          значение и код завершения\n"
           "  " + name + " batch <файл.txt> [-o отчёт.csv] [-d каталог] [-j потоки]\n"
           "  " + name + " generate <количество> <файл.txt> [--seed N] [--depth N] [--errors P]\n"
           "\n"
           "Коды завершения: 0 успех, 1 ошибка аргументов или ввода-вывода,\n"
           "2 лексическая ошибка, 3 синтаксическая ошибка, 4 деление на ноль (--eval).\n";
}

} // namespace exprcc
