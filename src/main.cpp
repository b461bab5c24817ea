/**
 * @file main.cpp
 * @brief Точка входа arbor-node
 *
 * arbor-node - хранилище состояния цепи Bitcoin на аккумуляторе Utreexo.
 * Вместо набора UTXO хранит лес корней, заголовки и undo данные
 * последних блоков.
 *
 * Основные компоненты:
 * 1. ChainStore - хранилище (LevelDB или плоские файлы)
 * 2. ChainState - заголовки, подключение блоков, реорганизации
 * 3. PruneManager - удаление старых undo данных
 *
 * Использование:
 *   arbor-node [options]
 *
 * Опции:
 *   -c, --config PATH        Путь к файлу конфигурации
 *   -h, --help               Показать справку
 *   -v, --version            Показать версию
 *   --test-config            Проверить конфигурацию и выйти
 *   --info                   Показать состояние цепи
 *   --import-headers FILE    Импортировать заголовки (по 80 байт подряд)
 *   --prune                  Выполнить один проход удаления
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/chain/chain_registry.hpp"
#include "core/validation/script_validator.hpp"
#include "chain/chain_state.hpp"
#include "chain/prune_manager.hpp"
#include "log/logger.hpp"
#include "storage/file_io.hpp"
#include "storage/store_factory.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "0.3.0";

/// @brief Заголовков в одной пачке при импорте
constexpr std::size_t IMPORT_BATCH_SIZE = 2000;

/// @brief Флаг для graceful shutdown
std::atomic<bool> g_running{true};

/**
 * @brief Обработчик сигналов
 */
void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_running.store(false, std::memory_order_relaxed);
    }
}

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
arbor-node v)" << VERSION << R"(
Состояние цепи Bitcoin на аккумуляторе Utreexo

ИСПОЛЬЗОВАНИЕ:
    arbor-node [ОПЦИИ]

ОПЦИИ:
    -c, --config PATH        Путь к файлу конфигурации (arbor.toml)
    -h, --help               Показать эту справку
    -v, --version            Показать версию программы
    --test-config            Проверить конфигурацию и выйти
    --info                   Показать tip, корни леса и высоту удаления
    --import-headers FILE    Импортировать заголовки из файла
                             (сырые 80-байтные заголовки подряд)
    --prune                  Выполнить один проход удаления и выйти

ПРИМЕРЫ:
    arbor-node -c /etc/arbor/arbor.toml --info
    arbor-node --import-headers headers.bin

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "arbor-node v" << VERSION << std::endl;
}

/**
 * @brief Вывести баннер при запуске
 */
void print_banner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════╗
║                                                       ║
║    █████╗ ██████╗ ██████╗  ██████╗ ██████╗            ║
║   ██╔══██╗██╔══██╗██╔══██╗██╔═══██╗██╔══██╗           ║
║   ███████║██████╔╝██████╔╝██║   ██║██████╔╝           ║
║   ██╔══██║██╔══██╗██╔══██╗██║   ██║██╔══██╗           ║
║   ██║  ██║██║  ██║██████╔╝╚██████╔╝██║  ██║           ║
║   ╚═╝  ╚═╝╚═╝  ╚═╝╚═════╝  ╚═════╝ ╚═╝  ╚═╝           ║
║                                                       ║
║          Utreexo chainstate  v)" << VERSION << R"(                   ║
║                                                       ║
╚═══════════════════════════════════════════════════════╝
)";
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    std::optional<std::string> import_path;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
    bool show_info = false;
    bool prune = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if (arg == "--info") {
            args.show_info = true;
        } else if (arg == "--prune") {
            args.prune = true;
        } else if (arg == "--import-headers" && i + 1 < argc) {
            args.import_path = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        }
    }

    return args;
}

/**
 * @brief Вывести состояние цепи
 */
void print_info(arbor::chain::ChainState& chain) {
    using namespace arbor;

    const auto snapshot = chain.snapshot();
    const auto best = chain.best_header();
    auto& store = chain.store();

    std::cout << "\n=== Состояние цепи ===" << std::endl;
    std::cout << "Сеть:              " << chain.params().name << std::endl;
    std::cout << "Хранилище:         " << store.name() << std::endl;
    std::cout << "Tip:               " << core::hash_to_hex(snapshot->tip.hash) << std::endl;
    std::cout << "Высота:            " << snapshot->tip.height << std::endl;
    std::cout << "Накопленная работа: " << snapshot->chain_work.to_hex() << std::endl;
    if (best) {
        std::cout << "Лучший заголовок:  " << best->height << std::endl;
    }
    std::cout << "Удалено до высоты: " << store.prune_height() << std::endl;
    std::cout << "Листьев добавлено: " << snapshot->forest.num_leaves << std::endl;
    std::cout << "Живых листьев:     " << snapshot->forest.live_leaves() << std::endl;
    std::cout << "Корней:            " << snapshot->forest.roots.size() << std::endl;
    for (const auto& root : snapshot->forest.roots) {
        std::cout << std::format("  [{:>2}] {} @ {}", root.row, core::hash_to_hex(root.hash), root.start())
                  << std::endl;
    }
}

/**
 * @brief Импорт заголовков из файла
 *
 * @return Количество принятых заголовков
 */
arbor::Result<std::size_t> import_headers(arbor::chain::ChainState& chain, const std::string& path) {
    using namespace arbor;

    auto data = storage::read_file(path);
    if (!data) {
        return std::unexpected(data.error());
    }
    if (data->size() % core::BLOCK_HEADER_SIZE != 0) {
        return Err<std::size_t>(ErrorCode::InvalidHeader,
                                std::format("Размер файла {} не кратен {} байтам", data->size(),
                                            core::BLOCK_HEADER_SIZE));
    }

    const std::size_t total = data->size() / core::BLOCK_HEADER_SIZE;
    log::info("Импорт {} заголовков из {}", total, path);

    std::size_t accepted = 0;
    std::vector<core::BlockHeader> batch;
    batch.reserve(IMPORT_BATCH_SIZE);

    for (std::size_t offset = 0; offset < total; offset += IMPORT_BATCH_SIZE) {
        if (!g_running.load(std::memory_order_relaxed)) {
            chain.request_shutdown();
            log::warn("Импорт прерван после {} заголовков", accepted);
            break;
        }

        batch.clear();
        const std::size_t end = std::min(total, offset + IMPORT_BATCH_SIZE);
        for (std::size_t i = offset; i < end; ++i) {
            batch.push_back(core::BlockHeader::deserialize(data->data() + i * core::BLOCK_HEADER_SIZE));
        }

        auto result = chain.accept_headers(batch);
        accepted += result.accepted;
        if (result.error) {
            return std::unexpected(*result.error);
        }
        log::info("Принято {} из {} заголовков", accepted, total);
    }
    return accepted;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace arbor;

    // Парсим аргументы
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Выводим баннер
    print_banner();

    // Загружаем конфигурацию
    log::info("Загрузка конфигурации...");

    auto config_result = args.config_path
        ? Config::load(*args.config_path)
        : Config::load_with_search();

    if (!config_result) {
        log::error("{}", config_result.error().message);
        return 1;
    }

    Config config = *config_result;

    // Валидируем конфигурацию
    auto validation = config.validate();
    if (!validation) {
        log::error("Ошибка валидации конфигурации: {}", validation.error().message);
        return 1;
    }

    if (auto level = log::parse_level(config.logging.level)) {
        log::set_level(*level);
    }

    log::info("Конфигурация загружена успешно: сеть {}, хранилище {} в {}",
              config.chain.network, to_string(config.storage.backend), config.storage.data_dir.string());

    if (args.test_config) {
        log::info("Конфигурация валидна");
        return 0;
    }

    const auto* params = core::ChainRegistry::instance().get_by_name(config.chain.network);
    if (params == nullptr) {
        log::error("Неизвестная сеть: {}", config.chain.network);
        return 1;
    }

    // Устанавливаем обработчики сигналов
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Открываем хранилище
    auto store = storage::open_chain_store(config.storage);
    if (!store) {
        log::error("Не удалось открыть хранилище: {}", store.error().message);
        return 1;
    }

    // Без внешней проверки скриптов блоки с CLI не подключаются
    core::validation::TrustingScriptValidator scripts;
    chain::ChainState chain(*params, **store, scripts, chain::ChainStateOptions::from_config(config));

    auto init = chain.init();
    if (!init) {
        log::error("Не удалось загрузить состояние цепи: {}", init.error().message);
        return 1;
    }

    chain::PruneManager pruner(**store, config.pruning, storage::retry_policy(config.storage));
    chain.set_tip_callback([&pruner](const storage::ChainTip& tip) { pruner.on_tip(tip); });

    int exit_code = 0;

    if (args.import_path) {
        auto imported = import_headers(chain, *args.import_path);
        if (!imported) {
            log::error("Импорт заголовков остановлен: {}", imported.error().message);
            exit_code = 1;
        } else {
            log::info("Импорт завершён: принято {} заголовков", *imported);
        }
    }

    if (args.prune) {
        auto pruned = pruner.run_once(chain.tip().height);
        if (!pruned) {
            log::error("Удаление не выполнено: {}", pruned.error().message);
            exit_code = 1;
        } else {
            log::info("Данные удалены до высоты {}", *pruned);
        }
    }

    if (args.show_info || (!args.import_path && !args.prune)) {
        print_info(chain);
    }

    log::info("arbor-node остановлен");
    return exit_code;
}
