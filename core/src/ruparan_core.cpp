/********************************************************************
 * ruparan-core.cpp  –  ruparan core implementation.
 ********************************************************************
Copyright (C) <2025> <Khumnath Cg/nath.khum@gmail.com>

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program. If not, see <https://www.gnu.org/licenses/>
 *******************************************************************/
#include "libruparan/ruparan_core.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

// ICU includes for Unicode string handling and character properties
#include <unicode/unistr.h>
#include <unicode/utypes.h>
#include <unicode/uchar.h>
#include <unicode/utf8.h>
#include <unicode/utf16.h>

#ifdef HAVE_SQLITE3
#include <sqlite3.h>
#endif

namespace fs = std::filesystem;

// =============================================================================//
// Standalone Function Implementations
// =============================================================================//

std::string getRuparanVersion() {
    // This macro is defined by the CMake build script
    return RUPARAN_VERSION;
}

// ----------------- Character classification -----------------
inline bool isDevanagari(char32_t c) { return c >= 0x0900 && c <= 0x097F; }

// Shares glyph slots with Devanagari in the DV-TT fonts
inline bool isGurmukhi(char32_t c) { return c >= 0x0A00 && c <= 0x0A7F; }

inline bool isPrintableAscii(char32_t c) { return c >= 0x0020 && c <= 0x007E; }

bool isAcceptedCodepoint(char32_t c) {
    return isDevanagari(c)
           || isGurmukhi(c)
           || isPrintableAscii(c)
           || u_isUWhiteSpace(static_cast<UChar32>(c));
}

std::string formatCodepoint(char32_t c) {
    std::ostringstream out;
    out << "U+" << std::uppercase << std::hex << std::setw(4) << std::setfill('0')
        << static_cast<uint32_t>(c);
    return out.str();
}

std::string codepointToUtf8(char32_t c) {
    icu::UnicodeString u;
    u.append(static_cast<UChar32>(c));
    std::string out;
    u.toUTF8String(out);
    return out;
}

// ----------------- UTF-8 helpers -----------------
static bool isWellFormedUtf8(const std::string& s) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
    int32_t length = static_cast<int32_t>(s.size());
    for (int32_t i = 0; i < length;) {
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c < 0) return false;
    }
    return true;
}

static int32_t countCodepoints(const std::string& s) {
    return icu::UnicodeString::fromUTF8(s).countChar32();
}

// ----------------- Residual scan -----------------
std::vector<Residual> findResiduals(const std::string& text, char32_t marker) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(text);
    std::map<char32_t, Residual> found;
    std::size_t index = 0;
    for (int32_t i = 0; i < u.length(); ++index) {
        UChar32 c = u.char32At(i);
        char32_t cp = static_cast<char32_t>(c);
        // A marker can only survive the reordering pass unconverted
        if (!isAcceptedCodepoint(cp) || cp == marker) {
            auto it = found.find(cp);
            if (it == found.end()) {
                found.emplace(cp, Residual{cp, 1, index});
            } else {
                it->second.count++;
            }
        }
        i += U16_LENGTH(c);
    }

    std::vector<Residual> residuals;
    residuals.reserve(found.size());
    for (const auto &[cp, residual] : found) {
        residuals.push_back(residual);
    }
    return residuals;
}


// =============================================================================//
// MappingTable Implementation (PImpl Idiom)
// =============================================================================//
class MappingTable::Impl {
public:
    Kind kind_ = MultiUnit;
    std::vector<MappingRule> rules_;
    // Same order as rules_, converted once for the substitution passes
    std::vector<std::pair<icu::UnicodeString, icu::UnicodeString>> compiled_;
    std::unordered_map<std::string, std::size_t> index_;
};

static const char* kindName(MappingTable::Kind kind) {
    return kind == MappingTable::MultiUnit ? "multi-unit" : "single-unit";
}

MappingTable::MappingTable(Kind kind, std::vector<MappingRule> rules) : pImpl(std::make_unique<Impl>()) {
    pImpl->kind_ = kind;

    std::vector<int32_t> lengths;
    lengths.reserve(rules.size());
    std::unordered_map<std::string, std::size_t> declaredAt;
    for (std::size_t i = 0; i < rules.size(); ++i) {
        const MappingRule& rule = rules[i];
        if (!isWellFormedUtf8(rule.legacy) || !isWellFormedUtf8(rule.unicode)) {
            throw std::runtime_error(std::string("Malformed UTF-8 in ") + kindName(kind) +
                                     " rule #" + std::to_string(i + 1));
        }
        int32_t length = countCodepoints(rule.legacy);
        if (length == 0) {
            throw std::runtime_error(std::string("Empty key in ") + kindName(kind) +
                                     " rule #" + std::to_string(i + 1));
        }
        if ((kind == MultiUnit && length < 2) || (kind == SingleUnit && length != 1)) {
            throw std::runtime_error(std::string("Key \"") + rule.legacy + "\" has " +
                                     std::to_string(length) + " codepoint(s), which does not fit the " +
                                     kindName(kind) + " table");
        }
        auto [it, inserted] = declaredAt.emplace(rule.legacy, i);
        if (!inserted) {
            throw std::runtime_error(std::string("Duplicate key \"") + rule.legacy + "\" in " +
                                     kindName(kind) + " table: rules #" + std::to_string(it->second + 1) +
                                     " and #" + std::to_string(i + 1));
        }
        lengths.push_back(length);
    }

    // Longest key first; stable so equal lengths keep declaration order
    std::vector<std::size_t> order(rules.size());
    for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&lengths](std::size_t a, std::size_t b) {
        return lengths[a] > lengths[b];
    });

    pImpl->rules_.reserve(rules.size());
    pImpl->compiled_.reserve(rules.size());
    for (std::size_t i : order) {
        pImpl->index_[rules[i].legacy] = pImpl->rules_.size();
        pImpl->compiled_.emplace_back(icu::UnicodeString::fromUTF8(rules[i].legacy),
                                      icu::UnicodeString::fromUTF8(rules[i].unicode));
        pImpl->rules_.push_back(std::move(rules[i]));
    }
}

MappingTable::~MappingTable() = default;
MappingTable::MappingTable(const MappingTable& other) : pImpl(std::make_unique<Impl>(*other.pImpl)) {}
MappingTable& MappingTable::operator=(const MappingTable& other) {
    if (this != &other) {
        pImpl = std::make_unique<Impl>(*other.pImpl);
    }
    return *this;
}
MappingTable::MappingTable(MappingTable&& other) noexcept = default;
MappingTable& MappingTable::operator=(MappingTable&& other) noexcept = default;

MappingTable::Kind MappingTable::kind() const { return pImpl->kind_; }
const std::vector<MappingRule>& MappingTable::rules() const { return pImpl->rules_; }
std::size_t MappingTable::size() const { return pImpl->rules_.size(); }

bool MappingTable::contains(const std::string& legacy) const {
    return pImpl->index_.count(legacy) > 0;
}

std::string MappingTable::lookup(const std::string& legacy) const {
    auto it = pImpl->index_.find(legacy);
    if (it == pImpl->index_.end()) {
        return "";
    }
    return pImpl->rules_[it->second].unicode;
}

void MappingTable::applyTo(icu::UnicodeString& text) const {
    // findAndReplace resumes after each inserted replacement, so one rule
    // never rewrites its own output
    for (const auto &[from, to] : pImpl->compiled_) {
        text.findAndReplace(from, to);
    }
}


// =============================================================================//
// Mapping File Parsing
// =============================================================================//
namespace {

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

// Reads a basic string whose opening quote is at line[pos]; leaves pos after the closing quote.
std::string readQuoted(const std::string& line, size_t& pos, const std::string& where) {
    std::string out;
    ++pos;
    while (pos < line.size()) {
        char c = line[pos++];
        if (c == '"') {
            return out;
        }
        if (c != '\\') {
            out += c;
            continue;
        }
        if (pos >= line.size()) break;
        char esc = line[pos++];
        switch (esc) {
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'u': {
                std::string hex = line.substr(pos, 4);
                if (hex.size() != 4 || hex.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
                    throw std::runtime_error(where + "invalid \\u escape");
                }
                out += codepointToUtf8(static_cast<char32_t>(std::stoul(hex, nullptr, 16)));
                pos += 4;
                break;
            }
            default:
                throw std::runtime_error(where + "unknown escape sequence \\" + std::string(1, esc));
        }
    }
    throw std::runtime_error(where + "unterminated string");
}

std::string readKey(const std::string& line, size_t& pos, const std::string& where) {
    if (line[pos] == '"') {
        return readQuoted(line, pos, where);
    }
    size_t start = pos;
    while (pos < line.size() && (std::isalnum(static_cast<unsigned char>(line[pos])) || line[pos] == '_' || line[pos] == '-')) {
        ++pos;
    }
    if (pos == start) {
        throw std::runtime_error(where + "expected a key");
    }
    return line.substr(start, pos - start);
}

void skipBlanks(const std::string& line, size_t& pos) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) ++pos;
}

char32_t singleCodepoint(const std::string& value, const std::string& where) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(value);
    if (u.countChar32() != 1) {
        throw std::runtime_error(where + "expected exactly one character, got \"" + value + "\"");
    }
    return static_cast<char32_t>(u.char32At(0));
}

} // namespace

MappingSet parseMappingToml(const std::string& content, const std::string& sourceName) {
    std::istringstream iss(content);
    std::string line, section;
    std::vector<MappingRule> multiUnit, singleUnit;
    ReorderRule reorder;
    std::unordered_map<std::string, int> multiLines, singleLines;
    int lineNo = 0;

    while (std::getline(iss, line)) {
        ++lineNo;
        const std::string where = sourceName + ":" + std::to_string(lineNo) + ": ";
        trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        if (line[0] == '[') {
            size_t close = line.find(']');
            if (close == std::string::npos) {
                throw std::runtime_error(where + "unterminated section header");
            }
            section = line.substr(1, close - 1);
            trim(section);
            continue;
        }

        size_t pos = 0;
        std::string key = readKey(line, pos, where);
        skipBlanks(line, pos);
        if (pos >= line.size() || line[pos] != '=') {
            throw std::runtime_error(where + "expected '=' after key \"" + key + "\"");
        }
        ++pos;
        skipBlanks(line, pos);
        if (pos >= line.size() || line[pos] != '"') {
            throw std::runtime_error(where + "expected a quoted value for key \"" + key + "\"");
        }
        std::string value = readQuoted(line, pos, where);
        skipBlanks(line, pos);
        if (pos < line.size() && line[pos] != '#') {
            throw std::runtime_error(where + "unexpected text after value");
        }

        if (section == "multiUnit" || section == "singleUnit") {
            auto& lines = section == "multiUnit" ? multiLines : singleLines;
            auto [it, inserted] = lines.emplace(key, lineNo);
            if (!inserted) {
                throw std::runtime_error(where + "duplicate key \"" + key + "\" in [" + section +
                                         "], first declared on line " + std::to_string(it->second));
            }
            (section == "multiUnit" ? multiUnit : singleUnit).push_back({key, value});
        } else if (section == "reorder") {
            if (key == "marker") {
                reorder.marker = singleCodepoint(value, where);
            } else if (key == "vowelSign") {
                reorder.vowelSign = singleCodepoint(value, where);
            } else {
                throw std::runtime_error(where + "unknown reorder setting \"" + key + "\"");
            }
        }
    }

    try {
        return MappingSet{MappingTable(MappingTable::MultiUnit, std::move(multiUnit)),
                          MappingTable(MappingTable::SingleUnit, std::move(singleUnit)),
                          reorder};
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(sourceName + ": " + e.what());
    }
}

MappingSet loadMappingFile(const std::string& path) {
    if (!fs::exists(path)) {
        throw std::runtime_error("Could not locate critical data file: " + path);
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open critical data file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseMappingToml(buffer.str(), fs::path(path).filename().string());
}


// =============================================================================//
// LegacyFontConverter Implementation (PImpl Idiom)
// =============================================================================//
class LegacyFontConverter::Impl {
public:
    MappingTable multiUnit_;
    MappingTable singleUnit_;
    ReorderRule reorder_;
    fs::path dataDir_;

    Impl(MappingSet set, fs::path dataDir)
        : multiUnit_(std::move(set.multiUnit)),
          singleUnit_(std::move(set.singleUnit)),
          reorder_(set.reorder),
          dataDir_(std::move(dataDir)) {}

    static fs::path resolveDataDir(const std::string& dataDir) {
        if (!dataDir.empty()) {
            return dataDir;
        } else if (fs::exists("/usr/share/libruparan/")) {
            return "/usr/share/libruparan/";
        }
        return "/usr/local/share/libruparan/";
    }

    icu::UnicodeString substitute(const icu::UnicodeString& input) const;
    icu::UnicodeString reorder(const icu::UnicodeString& input) const;
};

icu::UnicodeString LegacyFontConverter::Impl::substitute(const icu::UnicodeString& input) const {
    icu::UnicodeString text(input);
    multiUnit_.applyTo(text);
    singleUnit_.applyTo(text);
    return text;
}

icu::UnicodeString LegacyFontConverter::Impl::reorder(const icu::UnicodeString& input) const {
    const UChar32 marker = static_cast<UChar32>(reorder_.marker);
    icu::UnicodeString out;
    for (int32_t i = 0; i < input.length();) {
        UChar32 c = input.char32At(i);
        i += U16_LENGTH(c);
        if (c == marker && i < input.length()) {
            // The character after the marker takes its slot; it is not examined again
            UChar32 next = input.char32At(i);
            i += U16_LENGTH(next);
            out.append(next);
            out.append(static_cast<UChar32>(reorder_.vowelSign));
        } else {
            out.append(c);
        }
    }
    return out;
}

// Public LegacyFontConverter methods forwarding to Impl

LegacyFontConverter::LegacyFontConverter(const std::string& dataDir) {
    fs::path dir = Impl::resolveDataDir(dataDir);
    pImpl = std::make_unique<Impl>(loadMappingFile((dir / "mapping.toml").string()), dir);
}

LegacyFontConverter::LegacyFontConverter(MappingTable multiUnit, MappingTable singleUnit, ReorderRule reorder)
    : pImpl(std::make_unique<Impl>(MappingSet{std::move(multiUnit), std::move(singleUnit), reorder}, fs::path())) {}

LegacyFontConverter::~LegacyFontConverter() = default;

ConversionResult LegacyFontConverter::convert(const std::string& input) const {
    icu::UnicodeString text = pImpl->reorder(pImpl->substitute(icu::UnicodeString::fromUTF8(input)));
    ConversionResult result;
    text.toUTF8String(result.text);
    result.residuals = findResiduals(result.text, pImpl->reorder_.marker);
    return result;
}

std::string LegacyFontConverter::substitute(const std::string& input) const {
    std::string out;
    pImpl->substitute(icu::UnicodeString::fromUTF8(input)).toUTF8String(out);
    return out;
}

std::string LegacyFontConverter::reorder(const std::string& input) const {
    std::string out;
    pImpl->reorder(icu::UnicodeString::fromUTF8(input)).toUTF8String(out);
    return out;
}

const MappingTable& LegacyFontConverter::multiUnitTable() const { return pImpl->multiUnit_; }
const MappingTable& LegacyFontConverter::singleUnitTable() const { return pImpl->singleUnit_; }
const ReorderRule& LegacyFontConverter::reorderRule() const { return pImpl->reorder_; }
std::string LegacyFontConverter::dataDir() const { return pImpl->dataDir_.string(); }


#ifdef HAVE_SQLITE3
// =============================================================================//
// ResidualLedger Implementation (PImpl Idiom)
// =============================================================================//
class ResidualLedger::Impl {
public:
    sqlite3* db_ = nullptr;

    explicit Impl(const std::string& dbPath) {
        fs::path finalDbPath;
        if (!dbPath.empty()) {
            finalDbPath = dbPath;
        } else {
            const char* xdg_data_home = getenv("XDG_DATA_HOME");
            fs::path dataHome;
            if (xdg_data_home && xdg_data_home[0] != '\0') {
                dataHome = xdg_data_home;
            } else {
                const char* home = getenv("HOME");
                if (!home) {
                    throw std::runtime_error("Cannot find HOME or XDG_DATA_HOME directory.");
                }
                dataHome = fs::path(home) / ".local" / "share";
            }
            finalDbPath = dataHome / "libruparan" / "residuals.db";
        }

        if (finalDbPath.has_parent_path()) {
            fs::create_directories(finalDbPath.parent_path());
        }

        if (sqlite3_open(finalDbPath.c_str(), &db_) != SQLITE_OK) {
            std::string errMsg = db_ ? sqlite3_errmsg(db_) : "SQLite failed to open database";
            sqlite3_close(db_);
            db_ = nullptr;
            throw std::runtime_error("Can't open database: " + errMsg);
        }

        try {
            initializeDatabase();
        } catch (...) {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
    }

    ~Impl() {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    void initializeDatabase() {
        const char* sql =
            "CREATE TABLE IF NOT EXISTS residuals ("
            "codepoint INTEGER PRIMARY KEY,"
            "frequency INTEGER NOT NULL DEFAULT 0,"
            "first_source TEXT);"
            "CREATE TABLE IF NOT EXISTS meta ("
            "key TEXT PRIMARY KEY, value TEXT);"
            "INSERT OR IGNORE INTO meta (key, value) VALUES ('format_version', '1.0');"
            "INSERT OR IGNORE INTO meta (key, value) VALUES ('Db', 'ruparan');"
            "INSERT OR IGNORE INTO meta (key, value) VALUES ('script', 'Devanagari');"
            "INSERT OR IGNORE INTO meta (key, value) VALUES ('created_at', strftime('%Y-%m-%d', 'now'));";
        exec(sql, "SQL error during initialization: ");
    }

    void exec(const char* sql, const std::string& context) {
        char* errMsg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string err = context + (errMsg ? errMsg : sqlite3_errmsg(db_));
            sqlite3_free(errMsg);
            throw std::runtime_error(err);
        }
    }

    void requireConnection(const char* action) const {
        if (!db_) {
            throw std::runtime_error(std::string("Cannot ") + action + ": Database is not connected.");
        }
    }
};

//  Public ResidualLedger methods forwarding to Impl

ResidualLedger::ResidualLedger(const std::string& dbPath) : pImpl(std::make_unique<Impl>(dbPath)) {}
ResidualLedger::~ResidualLedger() = default;

void ResidualLedger::reset() {
    pImpl->requireConnection("reset");
    pImpl->exec("DELETE FROM residuals;", "Failed to reset ledger: ");
}

std::map<std::string, std::string> ResidualLedger::getDatabaseInfo() {
    if (!pImpl->db_) return {};
    std::map<std::string, std::string> info;
    sqlite3_stmt *stmt;

    if (sqlite3_prepare_v2(pImpl->db_, "SELECT COUNT(*), IFNULL(SUM(frequency), 0) FROM residuals;", -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            info["entry_count"] = std::to_string(sqlite3_column_int64(stmt, 0));
            info["total_occurrences"] = std::to_string(sqlite3_column_int64(stmt, 1));
        }
        sqlite3_finalize(stmt);
    }

    // Get the full path and replace home directory with ~
    std::string fullPath = sqlite3_db_filename(pImpl->db_, "main");
    const char* homeEnv = getenv("HOME");
    if (homeEnv && homeEnv[0] != '\0' && fullPath.rfind(homeEnv, 0) == 0) {
        info["db_path"] = "~" + fullPath.substr(strlen(homeEnv));
    } else {
        info["db_path"] = fullPath;
    }

    if (sqlite3_prepare_v2(pImpl->db_, "SELECT key, value FROM meta;", -1, &stmt, nullptr) == SQLITE_OK) {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            const unsigned char* key = sqlite3_column_text(stmt, 0);
            const unsigned char* val = sqlite3_column_text(stmt, 1);
            if (!key) continue;
            info[reinterpret_cast<const char*>(key)] = val ? reinterpret_cast<const char*>(val) : "";
        }
        sqlite3_finalize(stmt);
    }
    return info;
}

void ResidualLedger::record(const ConversionResult& result, const std::string& source) {
    pImpl->requireConnection("record residuals");
    if (result.residuals.empty()) return;

    sqlite3_stmt *stmt;
    const char *sql = "INSERT INTO residuals (codepoint, frequency, first_source) VALUES (?, ?, ?) "
                      "ON CONFLICT(codepoint) DO UPDATE SET frequency = frequency + excluded.frequency;";
    if (sqlite3_prepare_v2(pImpl->db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare insert: ") + sqlite3_errmsg(pImpl->db_));
    }
    for (const Residual& residual : result.residuals) {
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(residual.codepoint));
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(residual.count));
        sqlite3_bind_text(stmt, 3, source.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::string err = sqlite3_errmsg(pImpl->db_);
            sqlite3_finalize(stmt);
            throw std::runtime_error("Failed to record " + formatCodepoint(residual.codepoint) + ": " + err);
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);
}

long ResidualLedger::getFrequency(char32_t codepoint) {
    if (!pImpl->db_) {
        return -1;
    }
    sqlite3_stmt *stmt;
    const char *sql = "SELECT frequency FROM residuals WHERE codepoint = ?;";
    long frequency = -1;
    if (sqlite3_prepare_v2(pImpl->db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(codepoint));
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            frequency = static_cast<long>(sqlite3_column_int64(stmt, 0));
        }
        sqlite3_finalize(stmt);
    }
    return frequency;
}

long ResidualLedger::recordFromFile(const std::string& filePath, const LegacyFontConverter& converter) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filePath);
    }

    long linesWithResiduals = 0;
    long lineNo = 0;
    std::string line;
    beginTransaction();
    try {
        while (std::getline(file, line)) {
            ++lineNo;
            ConversionResult result = converter.convert(line);
            if (!result.clean()) {
                record(result, filePath + ":" + std::to_string(lineNo));
                linesWithResiduals++;
            }
        }
        commitTransaction();
    } catch (...) {
        rollbackTransaction();
        throw; // Re-throw the exception after rolling back
    }
    return linesWithResiduals;
}

std::vector<ResidualLedger::Entry> ResidualLedger::getAll(int limit, int offset, SortColumn sortBy, bool ascending) {
    std::vector<Entry> results;
    if (!pImpl->db_) return results;
    sqlite3_stmt *stmt;
    std::string sql_str = "SELECT codepoint, frequency, first_source FROM residuals ORDER BY " +
                          std::string(sortBy == ByFrequency ? "frequency " : "codepoint ") +
                          std::string(ascending ? "ASC" : "DESC") + ", codepoint ASC";
    if (limit > 0) sql_str += " LIMIT ?";
    if (offset > 0) sql_str += (limit > 0 ? " OFFSET ?" : " LIMIT -1 OFFSET ?");
    sql_str += ";";
    if (sqlite3_prepare_v2(pImpl->db_, sql_str.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        int bind_idx = 1;
        if (limit > 0) sqlite3_bind_int(stmt, bind_idx++, limit);
        if (offset > 0) sqlite3_bind_int(stmt, bind_idx++, offset);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            Entry entry;
            entry.codepoint = static_cast<char32_t>(sqlite3_column_int64(stmt, 0));
            entry.frequency = static_cast<long>(sqlite3_column_int64(stmt, 1));
            const unsigned char* source = sqlite3_column_text(stmt, 2);
            if (source) entry.firstSource = reinterpret_cast<const char*>(source);
            results.push_back(std::move(entry));
        }
        sqlite3_finalize(stmt);
    }
    return results;
}

void ResidualLedger::beginTransaction() {
    pImpl->requireConnection("begin transaction");
    pImpl->exec("BEGIN TRANSACTION;", "SQL error: ");
}

void ResidualLedger::commitTransaction() {
    pImpl->requireConnection("commit transaction");
    pImpl->exec("COMMIT;", "SQL error: ");
}

void ResidualLedger::rollbackTransaction() {
    if (!pImpl->db_) {
        // Called from catch blocks; nothing to undo without a connection
        return;
    }
    sqlite3_exec(pImpl->db_, "ROLLBACK;", nullptr, nullptr, nullptr);
}

#endif // HAVE_SQLITE3
