#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief LRU-кэш на диске с журналом (второй уровень, L2)
 *
 * Каждая запись — ключ и фиксированное число значений (valueCount),
 * каждое значение хранится в отдельном файле:
 * - key.i      — зафиксированное (clean) значение
 * - key.i.tmp  — значение в процессе записи (dirty)
 *
 * Журнал (файл journal):
 * @code
 *   tlcache.DiskLruCache
 *   1
 *   100
 *   1
 *
 *   DIRTY k1
 *   CLEAN k1 832
 *   READ k1
 *   REMOVE k1
 * @endcode
 * Первые пять строк — заголовок: магическая строка, версия журнала,
 * версия приложения, число значений на запись, пустая строка.
 *
 * Атомарность:
 * - запись идёт во временный файл, при commit() он переименовывается
 *   поверх clean-файла, затем в журнал пишется CLEAN
 * - журнал пересобирается через journal.tmp + rename, старый журнал
 *   на время пересборки сохраняется как journal.bkp
 * - записи, оставшиеся в состоянии DIRTY после сбоя, удаляются при open()
 *
 * Все операции сериализуются одним мьютексом и могут блокироваться на I/O.
 * Ошибки I/O — std::runtime_error / std::filesystem::filesystem_error.
 *
 * Пример:
 * @code
 *   auto cache = DiskLruCache::open("/tmp/images", 1, 1, 10 * 1024 * 1024);
 *   if (auto editor = cache->edit("logo")) {
 *       editor->set(0, bytes);
 *       editor->commit();
 *   }
 *   if (auto snapshot = cache->get("logo")) {
 *       auto data = snapshot->readAll(0);
 *   }
 * @endcode
 */
class DiskLruCache {
public:
    static constexpr const char* JOURNAL_FILE = "journal";
    static constexpr const char* JOURNAL_FILE_TEMP = "journal.tmp";
    static constexpr const char* JOURNAL_FILE_BACKUP = "journal.bkp";
    static constexpr const char* MAGIC = "tlcache.DiskLruCache";
    static constexpr const char* VERSION = "1";
    static constexpr int64_t ANY_SEQUENCE_NUMBER = -1;
    static constexpr size_t MAX_KEY_LENGTH = 120;

    /// Порог лишних строк журнала, после которого журнал пересобирается
    static constexpr size_t REDUNDANT_OP_COMPACT_THRESHOLD = 2000;

    class Editor;

    /**
     * @brief Снимок значений записи на момент get()
     *
     * Потоки открываются в get(), поэтому последующие remove()/edit()
     * не влияют на уже полученный снимок.
     */
    class Snapshot {
    public:
        Snapshot(Snapshot&&) = default;
        Snapshot& operator=(Snapshot&&) = default;

        const std::string& key() const { return key_; }

        /**
         * @brief Поток для чтения значения с индексом index
         */
        std::istream& stream(int index) {
            return *streams_.at(static_cast<size_t>(index));
        }

        /**
         * @brief Прочитать значение целиком
         * @throws std::runtime_error при ошибке чтения
         */
        std::vector<uint8_t> readAll(int index) {
            std::istream& in = stream(index);
            std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                                      std::istreambuf_iterator<char>());
            if (in.bad()) {
                throw std::runtime_error("Failed to read entry: " + key_);
            }
            return data;
        }

        std::string getString(int index) {
            auto data = readAll(index);
            return std::string(data.begin(), data.end());
        }

        /// Длина значения в байтах
        uint64_t length(int index) const {
            return lengths_.at(static_cast<size_t>(index));
        }

        /**
         * @brief Редактор для этой записи
         * @return nullptr, если запись изменилась после получения снимка
         *         или уже редактируется
         */
        std::unique_ptr<Editor> edit() {
            return cache_->edit(key_, sequenceNumber_);
        }

    private:
        friend class DiskLruCache;

        Snapshot(DiskLruCache* cache, std::string key, int64_t sequenceNumber,
                 std::vector<std::unique_ptr<std::ifstream>> streams,
                 std::vector<uint64_t> lengths)
            : cache_(cache)
            , key_(std::move(key))
            , sequenceNumber_(sequenceNumber)
            , streams_(std::move(streams))
            , lengths_(std::move(lengths))
        {}

        DiskLruCache* cache_;
        std::string key_;
        int64_t sequenceNumber_;
        std::vector<std::unique_ptr<std::ifstream>> streams_;
        std::vector<uint64_t> lengths_;
    };

    /**
     * @brief Транзакция записи значений одной записи
     *
     * Незафиксированный редактор при уничтожении откатывается.
     * @warning Редактор не должен переживать свой DiskLruCache.
     */
    class Editor {
    public:
        ~Editor() {
            if (done_) {
                return;
            }
            try {
                abort();
            } catch (const std::exception& e) {
                std::cerr << "[DiskLruCache] Failed to abort edit of " << key_
                          << ": " << e.what() << "\n";
            }
        }

        Editor(const Editor&) = delete;
        Editor& operator=(const Editor&) = delete;

        const std::string& key() const { return key_; }

        /**
         * @brief Открыть поток записи для значения index
         *
         * Пишет во временный файл; видимым значение станет после commit().
         * @throws std::runtime_error если файл не удалось открыть
         */
        std::ostream& newOutputStream(int index) {
            if (done_) {
                throw std::logic_error("Editor for " + key_ + " is already completed");
            }
            size_t slot = checkIndex(index);
            if (cache_->isClosed()) {
                throw std::runtime_error("cache is closed");
            }

            auto path = cache_->dirtyFile(key_, index);
            auto out = std::make_unique<std::ofstream>(
                path, std::ios::binary | std::ios::trunc);
            if (!*out) {
                // Каталог могли удалить извне — пробуем пересоздать
                std::filesystem::create_directories(cache_->directory_);
                out = std::make_unique<std::ofstream>(
                    path, std::ios::binary | std::ios::trunc);
                if (!*out) {
                    throw std::runtime_error("Failed to open file for writing: " + path.string());
                }
            }

            written_[slot] = true;
            streams_[slot] = std::move(out);
            return *streams_[slot];
        }

        /**
         * @brief Записать строку как значение index
         */
        void set(int index, const std::string& value) {
            newOutputStream(index) << value;
        }

        /**
         * @brief Зафиксировать изменения
         * @throws std::runtime_error если запись в файлы не удалась —
         *         в этом случае запись целиком удаляется из кэша
         * @throws std::logic_error если новая запись не заполнила все значения
         */
        void commit() {
            if (done_) {
                throw std::logic_error("Editor for " + key_ + " is already completed");
            }
            if (closeStreams()) {
                cache_->completeEdit(*this, false);
                cache_->remove(key_);
                throw std::runtime_error("Failed to write entry: " + key_);
            }
            cache_->completeEdit(*this, true);
            committed_ = true;
        }

        /**
         * @brief Откатить изменения
         */
        void abort() {
            if (done_) {
                return;
            }
            closeStreams();
            cache_->completeEdit(*this, false);
        }

        void abortUnlessCommitted() {
            if (!committed_) {
                abort();
            }
        }

    private:
        friend class DiskLruCache;

        Editor(DiskLruCache* cache, std::string key, int valueCount)
            : cache_(cache)
            , key_(std::move(key))
            , written_(static_cast<size_t>(valueCount), false)
            , streams_(static_cast<size_t>(valueCount))
        {}

        size_t checkIndex(int index) const {
            if (index < 0 || static_cast<size_t>(index) >= written_.size()) {
                throw std::invalid_argument("Value index out of range: " + std::to_string(index));
            }
            return static_cast<size_t>(index);
        }

        /// @return true если хотя бы один поток завершился с ошибкой
        bool closeStreams() {
            bool hasErrors = false;
            for (auto& out : streams_) {
                if (!out) {
                    continue;
                }
                out->flush();
                out->close();
                if (out->fail()) {
                    hasErrors = true;
                }
                out.reset();
            }
            return hasErrors;
        }

        DiskLruCache* cache_;
        std::string key_;
        std::vector<bool> written_;
        std::vector<std::unique_ptr<std::ofstream>> streams_;
        bool committed_ = false;
        bool done_ = false;
    };

    /**
     * @brief Открыть кэш в каталоге, создав его при необходимости
     * @param directory Каталог кэша (кэш владеет им целиком)
     * @param appVersion Версия формата данных приложения
     * @param valueCount Число значений на запись (> 0)
     * @param maxSize Максимальный суммарный размер значений в байтах (> 0)
     * @throws std::invalid_argument при некорректных параметрах
     * @throws std::runtime_error если журнал создан с другими
     *         appVersion/valueCount или другой версией формата
     *
     * Если заголовок журнала корректен, но сами записи повреждены,
     * каталог очищается и кэш начинает работу с нуля.
     */
    static std::unique_ptr<DiskLruCache> open(const std::filesystem::path& directory,
                                              int appVersion, int valueCount,
                                              uint64_t maxSize) {
        namespace fs = std::filesystem;

        if (maxSize == 0) {
            throw std::invalid_argument("DiskLruCache maxSize must be greater than 0");
        }
        if (valueCount <= 0) {
            throw std::invalid_argument("DiskLruCache valueCount must be greater than 0");
        }

        // Если пересборка журнала прервалась — восстанавливаем из backup
        auto backupFile = directory / JOURNAL_FILE_BACKUP;
        if (fs::exists(backupFile)) {
            auto journalFile = directory / JOURNAL_FILE;
            if (fs::exists(journalFile)) {
                fs::remove(backupFile);
            } else {
                fs::rename(backupFile, journalFile);
            }
        }

        std::unique_ptr<DiskLruCache> cache(
            new DiskLruCache(directory, appVersion, valueCount, maxSize));

        auto journalFile = directory / JOURNAL_FILE;
        if (fs::exists(journalFile)) {
            std::ifstream in(journalFile, std::ios::binary);
            if (!in) {
                throw std::runtime_error("Failed to open journal: " + journalFile.string());
            }
            cache->readJournalHeader(in);

            try {
                cache->readJournalEntries(in);
                in.close();
                cache->processJournal();
                return cache;
            } catch (const std::exception& e) {
                std::cerr << "[DiskLruCache] " << directory.string() << " is corrupt: "
                          << e.what() << ", removing\n";
            }
            in.close();
            cache->discard();
            fs::remove_all(directory);
        }

        fs::create_directories(directory);
        cache.reset(new DiskLruCache(directory, appVersion, valueCount, maxSize));
        {
            std::lock_guard<std::mutex> lock(cache->mutex_);
            cache->rebuildJournalLocked();
        }
        return cache;
    }

    ~DiskLruCache() {
        try {
            close();
        } catch (const std::exception& e) {
            std::cerr << "[DiskLruCache] Failed to close " << directory_.string()
                      << ": " << e.what() << "\n";
        }
    }

    DiskLruCache(const DiskLruCache&) = delete;
    DiskLruCache& operator=(const DiskLruCache&) = delete;

    /**
     * @brief Получить снимок записи
     * @return Снимок или std::nullopt, если записи нет или она ещё
     *         ни разу не была зафиксирована
     */
    std::optional<Snapshot> get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        checkNotClosed();
        validateKey(key);

        auto it = entries_.find(key);
        if (it == entries_.end() || !it->second.readable) {
            return std::nullopt;
        }

        std::vector<std::unique_ptr<std::ifstream>> streams;
        streams.reserve(static_cast<size_t>(valueCount_));
        for (int i = 0; i < valueCount_; ++i) {
            auto in = std::make_unique<std::ifstream>(cleanFile(key, i), std::ios::binary);
            if (!*in) {
                // Файл удалили вручную — считаем, что записи нет
                return std::nullopt;
            }
            streams.push_back(std::move(in));
        }

        Entry& entry = it->second;
        touch(entry);
        int64_t sequenceNumber = entry.sequenceNumber;
        std::vector<uint64_t> lengths = entry.lengths;

        ++redundantOpCount_;
        writeJournalLine("READ " + key);
        if (journalRebuildRequired()) {
            cleanupLocked();
        }

        return Snapshot(this, key, sequenceNumber, std::move(streams), std::move(lengths));
    }

    /**
     * @brief Начать редактирование записи
     * @return Редактор или nullptr, если запись уже редактируется
     */
    std::unique_ptr<Editor> edit(const std::string& key) {
        return edit(key, ANY_SEQUENCE_NUMBER);
    }

    /**
     * @brief Удалить запись
     * @return true если запись была удалена; false если её нет
     *         или она сейчас редактируется
     */
    bool remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        checkNotClosed();
        validateKey(key);

        bool removed = removeLocked(key);
        if (removed && journalRebuildRequired()) {
            cleanupLocked();
        }
        return removed;
    }

    /**
     * @brief Текущий размер значений в байтах
     *
     * Может временно превышать maxSize() до ближайшего commit()/flush().
     */
    uint64_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    uint64_t maxSize() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return maxSize_;
    }

    /**
     * @brief Изменить максимальный размер и сразу ужаться до него
     */
    void setMaxSize(uint64_t maxSize) {
        if (maxSize == 0) {
            throw std::invalid_argument("DiskLruCache maxSize must be greater than 0");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        maxSize_ = maxSize;
        if (!closed_) {
            cleanupLocked();
        }
    }

    const std::filesystem::path& directory() const {
        return directory_;
    }

    /**
     * @brief Вытеснить лишнее и сбросить журнал на диск
     */
    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        checkNotClosed();
        trimToSizeLocked();
        journalWriter_.flush();
        if (!journalWriter_) {
            throw std::runtime_error("Failed to flush journal in " + directory_.string());
        }
    }

    /**
     * @brief Закрыть кэш; данные остаются на диске
     *
     * Активные редакторы отвязываются от записей: их потоки закроет
     * владелец редактора, а commit() после закрытия откатывает правку.
     */
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }

        for (auto it = entries_.begin(); it != entries_.end();) {
            auto current = it++;
            Entry& entry = current->second;
            if (entry.currentEditor == nullptr) {
                continue;
            }
            entry.currentEditor = nullptr;
            ++redundantOpCount_;
            if (entry.readable) {
                writeJournalLine("CLEAN " + current->first + lengthsString(entry));
            } else {
                std::string key = current->first;
                eraseEntry(current);
                writeJournalLine("REMOVE " + key);
            }
        }

        trimToSizeLocked();
        journalWriter_.close();
        closed_ = true;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /**
     * @brief Закрыть кэш и удалить каталог целиком
     *
     * Удаляются ВСЕ файлы каталога, включая созданные не кэшем.
     */
    void deleteCache() {
        close();
        std::filesystem::remove_all(directory_);

        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        order_.clear();
        size_ = 0;
    }

private:
    struct Entry {
        std::vector<uint64_t> lengths;
        /// Запись хотя бы раз была зафиксирована
        bool readable = false;
        /// Незавершённая запись из журнала (DIRTY без CLEAN/REMOVE)
        bool dirty = false;
        Editor* currentEditor = nullptr;
        int64_t sequenceNumber = 0;
        std::list<std::string>::iterator orderIt;
    };

    using EntryMap = std::unordered_map<std::string, Entry>;

    DiskLruCache(std::filesystem::path directory, int appVersion,
                 int valueCount, uint64_t maxSize)
        : directory_(std::move(directory))
        , appVersion_(appVersion)
        , valueCount_(valueCount)
        , maxSize_(maxSize)
    {}

    /**
     * @brief Закрыть без вытеснения и записи в журнал (журнал повреждён)
     */
    void discard() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (journalWriter_.is_open()) {
            journalWriter_.close();
        }
        closed_ = true;
    }

    // ==================== Журнал ====================

    void readJournalHeader(std::istream& in) {
        std::string magic, version, appVersion, valueCount, blank;
        std::getline(in, magic);
        std::getline(in, version);
        std::getline(in, appVersion);
        std::getline(in, valueCount);
        std::getline(in, blank);

        if (in.fail()
                || magic != MAGIC
                || version != VERSION
                || appVersion != std::to_string(appVersion_)
                || valueCount != std::to_string(valueCount_)
                || !blank.empty()) {
            throw std::runtime_error("unexpected journal header: [" + magic + ", " + version
                                     + ", " + appVersion + ", " + valueCount + ", " + blank + "]");
        }
    }

    void readJournalEntries(std::istream& in) {
        size_t lineCount = 0;
        bool unterminated = false;
        std::string line;
        while (std::getline(in, line)) {
            if (in.eof()) {
                // Последняя строка без '\n' — запись прервалась при сбое
                unterminated = true;
                break;
            }
            readJournalLine(line);
            ++lineCount;
        }
        if (in.bad()) {
            throw std::runtime_error("Failed to read journal in " + directory_.string());
        }

        redundantOpCount_ = lineCount > entries_.size() ? lineCount - entries_.size() : 0;
        rebuildOnOpen_ = unterminated;
    }

    void readJournalLine(const std::string& line) {
        auto firstSpace = line.find(' ');
        if (firstSpace == std::string::npos) {
            throw std::runtime_error("unexpected journal line: " + line);
        }

        std::string command = line.substr(0, firstSpace);
        auto keyBegin = firstSpace + 1;
        auto secondSpace = line.find(' ', keyBegin);
        std::string key = secondSpace == std::string::npos
            ? line.substr(keyBegin)
            : line.substr(keyBegin, secondSpace - keyBegin);

        if (command == "REMOVE" && secondSpace == std::string::npos) {
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                eraseEntry(it);
            }
            return;
        }

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            it = insertEntry(key);
        } else {
            touch(it->second);
        }
        Entry& entry = it->second;

        if (command == "CLEAN" && secondSpace != std::string::npos) {
            entry.readable = true;
            entry.dirty = false;
            entry.lengths = parseLengths(line.substr(secondSpace + 1), line);
        } else if (command == "DIRTY" && secondSpace == std::string::npos) {
            entry.dirty = true;
        } else if (command == "READ" && secondSpace == std::string::npos) {
            // Только обновление порядка
        } else {
            throw std::runtime_error("unexpected journal line: " + line);
        }
    }

    std::vector<uint64_t> parseLengths(const std::string& text, const std::string& line) const {
        std::vector<uint64_t> lengths;
        std::istringstream in(text);
        std::string token;
        while (in >> token) {
            bool digits = !token.empty() && std::all_of(token.begin(), token.end(),
                [](char c) { return c >= '0' && c <= '9'; });
            if (!digits) {
                throw std::runtime_error("unexpected journal line: " + line);
            }
            lengths.push_back(std::stoull(token));
        }
        if (lengths.size() != static_cast<size_t>(valueCount_)) {
            throw std::runtime_error("unexpected journal line: " + line);
        }
        return lengths;
    }

    /**
     * @brief Подсчитать размер и удалить незавершённые записи
     */
    void processJournal() {
        namespace fs = std::filesystem;
        fs::remove(directory_ / JOURNAL_FILE_TEMP);

        for (auto it = entries_.begin(); it != entries_.end();) {
            Entry& entry = it->second;
            if (entry.dirty || !entry.readable) {
                if (entry.dirty) {
                    for (int i = 0; i < valueCount_; ++i) {
                        fs::remove(cleanFile(it->first, i));
                        fs::remove(dirtyFile(it->first, i));
                    }
                }
                order_.erase(entry.orderIt);
                it = entries_.erase(it);
                continue;
            }
            for (uint64_t length : entry.lengths) {
                size_ += length;
            }
            ++it;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (rebuildOnOpen_) {
            rebuildJournalLocked();
        } else {
            openJournalWriter();
        }
        if (size_ > maxSize_) {
            cleanupLocked();
        }
    }

    /**
     * @brief Переписать журнал, оставив только актуальные записи
     * @note Вызывать под lock!
     */
    void rebuildJournalLocked() {
        namespace fs = std::filesystem;

        if (journalWriter_.is_open()) {
            journalWriter_.close();
        }

        auto tempFile = directory_ / JOURNAL_FILE_TEMP;
        {
            std::ofstream out(tempFile, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("Failed to open journal for writing: " + tempFile.string());
            }

            out << MAGIC << '\n'
                << VERSION << '\n'
                << appVersion_ << '\n'
                << valueCount_ << '\n'
                << '\n';

            // От старых к свежим: при чтении порядок восстановится
            for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
                const Entry& entry = entries_.at(*it);
                if (entry.currentEditor != nullptr) {
                    out << "DIRTY " << *it << '\n';
                } else if (entry.readable) {
                    out << "CLEAN " << *it << lengthsString(entry) << '\n';
                }
            }

            out.flush();
            if (!out) {
                throw std::runtime_error("Failed to write journal: " + tempFile.string());
            }
        }

        auto journalFile = directory_ / JOURNAL_FILE;
        auto backupFile = directory_ / JOURNAL_FILE_BACKUP;
        if (fs::exists(journalFile)) {
            fs::rename(journalFile, backupFile);
        }
        fs::rename(tempFile, journalFile);
        fs::remove(backupFile);

        openJournalWriter();
        redundantOpCount_ = 0;
    }

    void openJournalWriter() {
        auto journalFile = directory_ / JOURNAL_FILE;
        journalWriter_.open(journalFile, std::ios::binary | std::ios::app);
        if (!journalWriter_) {
            throw std::runtime_error("Failed to open journal for append: " + journalFile.string());
        }
    }

    /// @note Вызывать под lock!
    void writeJournalLine(const std::string& line) {
        journalWriter_ << line << '\n';
        journalWriter_.flush();
        if (!journalWriter_) {
            throw std::runtime_error("Failed to write journal in " + directory_.string());
        }
    }

    bool journalRebuildRequired() const {
        return redundantOpCount_ >= REDUNDANT_OP_COMPACT_THRESHOLD
            && redundantOpCount_ >= entries_.size();
    }

    // ==================== Редактирование ====================

    std::unique_ptr<Editor> edit(const std::string& key, int64_t expectedSequenceNumber) {
        std::lock_guard<std::mutex> lock(mutex_);
        checkNotClosed();
        validateKey(key);

        auto it = entries_.find(key);
        if (expectedSequenceNumber != ANY_SEQUENCE_NUMBER
                && (it == entries_.end() || it->second.sequenceNumber != expectedSequenceNumber)) {
            return nullptr;  // Снимок устарел
        }
        if (it != entries_.end() && it->second.currentEditor != nullptr) {
            return nullptr;  // Уже редактируется
        }

        // DIRTY пишется до создания редактора, чтобы сбой журнала
        // не оставил редактор без записи в индексе
        writeJournalLine("DIRTY " + key);

        if (it == entries_.end()) {
            it = insertEntry(key);
        } else {
            touch(it->second);
        }

        std::unique_ptr<Editor> editor(new Editor(this, key, valueCount_));
        it->second.currentEditor = editor.get();
        return editor;
    }

    void completeEdit(Editor& editor, bool success) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            // Правку отвязал close(); остаётся убрать временные файлы
            editor.done_ = true;
            for (int i = 0; i < valueCount_; ++i) {
                std::error_code ec;
                std::filesystem::remove(dirtyFile(editor.key_, i), ec);
            }
            if (success) {
                throw std::runtime_error("cache is closed");
            }
            return;
        }
        completeEditLocked(editor, success);
    }

    /**
     * @brief Завершить редактирование: зафиксировать или откатить
     * @note Вызывать под lock!
     */
    void completeEditLocked(Editor& editor, bool success) {
        namespace fs = std::filesystem;

        editor.done_ = true;
        const std::string key = editor.key_;

        auto it = entries_.find(key);
        if (it == entries_.end() || it->second.currentEditor != &editor) {
            throw std::logic_error("Editor is not the current editor of " + key);
        }
        Entry& entry = it->second;
        entry.currentEditor = nullptr;

        // Новая запись обязана заполнить все значения
        bool missingValue = false;
        if (success && !entry.readable) {
            for (size_t i = 0; i < editor.written_.size(); ++i) {
                if (!editor.written_[i]) {
                    missingValue = true;
                    success = false;
                    break;
                }
            }
        }

        for (int i = 0; i < valueCount_; ++i) {
            auto dirty = dirtyFile(key, i);
            if (success) {
                if (fs::exists(dirty)) {
                    auto clean = cleanFile(key, i);
                    fs::rename(dirty, clean);
                    uint64_t newLength = fs::file_size(clean);
                    size_ = size_ - entry.lengths[static_cast<size_t>(i)] + newLength;
                    entry.lengths[static_cast<size_t>(i)] = newLength;
                }
            } else {
                fs::remove(dirty);
            }
        }

        ++redundantOpCount_;
        if (entry.readable || success) {
            entry.readable = true;
            if (success) {
                entry.sequenceNumber = nextSequenceNumber_++;
            }
            writeJournalLine("CLEAN " + key + lengthsString(entry));
        } else {
            eraseEntry(it);
            writeJournalLine("REMOVE " + key);
        }

        if (size_ > maxSize_ || journalRebuildRequired()) {
            cleanupLocked();
        }

        if (missingValue) {
            throw std::logic_error("Newly created entry " + key + " didn't create a value for every index");
        }
    }

    // ==================== Вытеснение ====================

    /// @note Вызывать под lock!
    bool removeLocked(const std::string& key) {
        namespace fs = std::filesystem;

        auto it = entries_.find(key);
        if (it == entries_.end() || it->second.currentEditor != nullptr) {
            return false;
        }

        Entry& entry = it->second;
        for (int i = 0; i < valueCount_; ++i) {
            fs::remove(cleanFile(key, i));
            size_ -= entry.lengths[static_cast<size_t>(i)];
            entry.lengths[static_cast<size_t>(i)] = 0;
        }

        ++redundantOpCount_;
        eraseEntry(it);
        writeJournalLine("REMOVE " + key);
        return true;
    }

    /**
     * @brief Удалять самые старые записи, пока размер больше maxSize
     *
     * Записи, которые сейчас редактируются, пропускаются.
     * @note Вызывать под lock!
     */
    void trimToSizeLocked() {
        while (size_ > maxSize_) {
            std::optional<std::string> victim;
            for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
                if (entries_.at(*it).currentEditor == nullptr) {
                    victim = *it;
                    break;
                }
            }
            if (!victim) {
                break;
            }
            removeLocked(*victim);
        }
    }

    /// @note Вызывать под lock!
    void cleanupLocked() {
        trimToSizeLocked();
        if (journalRebuildRequired()) {
            rebuildJournalLocked();
        }
    }

    // ==================== LRU-порядок ====================

    EntryMap::iterator insertEntry(const std::string& key) {
        order_.push_front(key);
        Entry entry;
        entry.lengths.assign(static_cast<size_t>(valueCount_), 0);
        entry.orderIt = order_.begin();
        return entries_.emplace(key, std::move(entry)).first;
    }

    void eraseEntry(EntryMap::iterator it) {
        order_.erase(it->second.orderIt);
        entries_.erase(it);
    }

    /// Переместить запись в начало (MRU)
    void touch(Entry& entry) {
        order_.splice(order_.begin(), order_, entry.orderIt);
    }

    // ==================== Утилиты ====================

    std::filesystem::path cleanFile(const std::string& key, int index) const {
        return directory_ / (key + "." + std::to_string(index));
    }

    std::filesystem::path dirtyFile(const std::string& key, int index) const {
        return directory_ / (key + "." + std::to_string(index) + ".tmp");
    }

    static std::string lengthsString(const Entry& entry) {
        std::string result;
        for (uint64_t length : entry.lengths) {
            result += ' ';
            result += std::to_string(length);
        }
        return result;
    }

    void checkNotClosed() const {
        if (closed_) {
            throw std::runtime_error("cache is closed");
        }
    }

    static void validateKey(const std::string& key) {
        bool valid = !key.empty() && key.size() <= MAX_KEY_LENGTH
            && std::all_of(key.begin(), key.end(), [](char c) {
                   return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
               });
        if (!valid) {
            throw std::invalid_argument("keys must match regex [a-z0-9_-]{1,120}: \"" + key + "\"");
        }
    }

private:
    const std::filesystem::path directory_;
    const int appVersion_;
    const int valueCount_;
    uint64_t maxSize_;
    uint64_t size_ = 0;

    /// Индекс записей; порядок: front() = MRU, back() = LRU
    EntryMap entries_;
    std::list<std::string> order_;

    std::ofstream journalWriter_;
    size_t redundantOpCount_ = 0;
    bool rebuildOnOpen_ = false;
    int64_t nextSequenceNumber_ = 0;
    bool closed_ = false;

    mutable std::mutex mutex_;
};
