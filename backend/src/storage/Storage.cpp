#include "Storage.hpp"
#include "../core/Errors.hpp"
#include "../utils/TimeUtil.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>
#include <sodium.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static const char PLAIN_HDR[] = "FMNSTORE1";
static const char SEAL_HDR[] = "FMNSEAL1\n";
static const char RECORD_END[] = "---";

namespace {

std::string escapeValue(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        default: out += c; break;
        }
    }
    return out;
}

std::string unescapeValue(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        if (v[i] != '\\' || i + 1 == v.size()) {
            out += v[i];
            continue;
        }
        char next = v[++i];
        if (next == 'n') out += '\n';
        else if (next == 'r') out += '\r';
        else if (next == '\\') out += '\\';
        else { out += '\\'; out += next; }
    }
    return out;
}

bool parseInt(const std::string& s, int& out) {
    if (s.empty()) return false;
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) return false;
        out = v;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

using Fields = std::map<std::string, std::string>;

// Builds a Topic from one record's fields. Returns false (with a warning)
// when a required field is missing or unreadable.
bool buildTopic(const Fields& f, size_t line, Topic& t) {
    auto require = [&](const char* key) -> const std::string* {
        auto it = f.find(key);
        if (it == f.end()) {
            spdlog::warn("Store record ending at line {}: missing '{}', record skipped", line, key);
            return nullptr;
        }
        return &it->second;
    };
    auto readTime = [&](const char* key, std::time_t& out) {
        const std::string* v = require(key);
        if (!v) return false;
        auto parsed = TimeUtil::fromIso8601(*v);
        if (!parsed) {
            spdlog::warn("Store record ending at line {}: bad timestamp {}='{}', record skipped", line, key, *v);
            return false;
        }
        out = *parsed;
        return true;
    };
    auto readInt = [&](const char* key, int& out) {
        const std::string* v = require(key);
        if (!v) return false;
        if (!parseInt(*v, out)) {
            spdlog::warn("Store record ending at line {}: bad integer {}='{}', record skipped", line, key, *v);
            return false;
        }
        return true;
    };

    const std::string* name = require("name");
    if (!name) return false;
    t.name = *name;
    try {
        Topic::validateName(t.name);
    }
    catch (const ValidationError& e) {
        spdlog::warn("Store record ending at line {}: {}, record skipped", line, e.what());
        return false;
    }

    auto desc = f.find("description");
    t.description = desc != f.end() ? desc->second : "";

    if (!readTime("created_at", t.created_at)) return false;
    if (!readTime("last_review_at", t.last_review_at)) return false;
    if (!readInt("interval_index", t.interval_index)) return false;
    if (!readInt("review_count", t.review_count)) return false;
    if (!readInt("total_successes", t.total_successes)) return false;
    if (!readInt("total_reviews", t.total_reviews)) return false;

    // derivable fields: absent means "recompute"
    t.success_streak = 0;
    if (f.count("success_streak") && !readInt("success_streak", t.success_streak)) return false;
    t.next_review_at = 0;
    if (f.count("next_review_at") && !readTime("next_review_at", t.next_review_at)) return false;

    return true;
}

void ensureSodium() {
    if (sodium_init() < 0)
        throw PersistenceError("Failed to initialize libsodium");
}

// Argon2id key from passphrase + salt. Caller wipes the key.
std::vector<unsigned char> deriveKey(const std::string& passphrase, const unsigned char* salt) {
    std::vector<unsigned char> key(crypto_secretbox_KEYBYTES, 0);
    if (crypto_pwhash(key.data(),
        key.size(),
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt,
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during store key derivation");
        throw PersistenceError("Key derivation failed (out of memory)");
    }
    return key;
}

std::string errnoText() {
    return std::strerror(errno);
}

} // namespace

std::string Storage::serializeTopics(const std::vector<Topic>& topics) {
    std::ostringstream oss;
    oss << PLAIN_HDR << "\n";

    for (const auto& t : topics) {
        oss << "name=" << escapeValue(t.name) << "\n"
            << "description=" << escapeValue(t.description) << "\n"
            << "created_at=" << TimeUtil::toIso8601(t.created_at) << "\n"
            << "last_review_at=" << TimeUtil::toIso8601(t.last_review_at) << "\n"
            << "next_review_at=" << TimeUtil::toIso8601(t.next_review_at) << "\n"
            << "interval_index=" << t.interval_index << "\n"
            << "review_count=" << t.review_count << "\n"
            << "success_streak=" << t.success_streak << "\n"
            << "total_successes=" << t.total_successes << "\n"
            << "total_reviews=" << t.total_reviews << "\n"
            << RECORD_END << "\n";
    }

    return oss.str();
}

std::vector<Topic> Storage::parseTopics(const std::string& plain, const Ladder& ladder) {
    std::istringstream iss(plain);
    std::string line;

    if (!std::getline(iss, line)) {
        spdlog::error("Store is empty (no header)");
        throw PersistenceError("Store file has no header");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line != PLAIN_HDR) {
        spdlog::error("Invalid store header '{}'", line);
        throw PersistenceError("Invalid store header");
    }

    std::vector<Topic> topics;
    std::set<std::string> seen;
    Fields fields;
    bool malformed = false;
    size_t lineNo = 1;

    auto finishRecord = [&]() {
        if (malformed) {
            spdlog::warn("Store record ending at line {}: malformed line, record skipped", lineNo);
            return;
        }

        Topic t;
        if (!buildTopic(fields, lineNo, t)) return;

        try {
            t.checkInvariants(ladder);
        }
        catch (const InvalidStateError& e) {
            spdlog::warn("{}; repairing record", e.what());
            t.coerce(ladder);
        }

        if (!seen.insert(t.name).second) {
            spdlog::warn("Duplicate topic '{}' at line {}; keeping the first", t.name, lineNo);
            return;
        }
        topics.push_back(std::move(t));
    };

    while (std::getline(iss, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (line == RECORD_END) {
            finishRecord();
            fields.clear();
            malformed = false;
            continue;
        }
        if (line.empty() && fields.empty() && !malformed) continue;

        auto pos = line.find('=');
        if (pos == std::string::npos || pos == 0) {
            malformed = true;
            continue;
        }

        std::string key = line.substr(0, pos);
        if (!fields.emplace(key, unescapeValue(line.substr(pos + 1))).second)
            malformed = true;
    }

    if (!fields.empty() || malformed)
        spdlog::warn("Unterminated record at end of store; skipped");

    spdlog::debug("Parsed {} topics", topics.size());
    return topics;
}

bool Storage::isSealed(const std::string& data) {
    return data.compare(0, sizeof(SEAL_HDR) - 1, SEAL_HDR) == 0;
}

std::string Storage::seal(const std::string& plain, const std::string& passphrase) {
    ensureSodium();
    if (passphrase.empty())
        throw PersistenceError("Cannot seal the store with an empty passphrase");

    unsigned char salt[crypto_pwhash_SALTBYTES];
    randombytes_buf(salt, sizeof(salt));
    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    std::vector<unsigned char> key = deriveKey(passphrase, salt);

    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();
    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    int rc = crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data());
    sodium_memzero(key.data(), key.size());
    if (rc != 0) {
        spdlog::error("Encryption failed");
        throw PersistenceError("Store encryption failed");
    }

    std::string out(SEAL_HDR, sizeof(SEAL_HDR) - 1);
    out.append(reinterpret_cast<const char*>(salt), sizeof(salt));
    out.append(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    out.append(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
    return out;
}

std::string Storage::unseal(const std::string& sealed, const std::string& passphrase) {
    ensureSodium();
    if (!isSealed(sealed)) {
        spdlog::error("Invalid sealed store header");
        throw PersistenceError("Invalid sealed store header");
    }
    if (passphrase.empty())
        throw PersistenceError("Store is encrypted; set FORGETMENOT_PASSPHRASE");

    const size_t hdrLen = sizeof(SEAL_HDR) - 1;
    const size_t minLen = hdrLen + crypto_pwhash_SALTBYTES + crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES;
    if (sealed.size() < minLen) {
        spdlog::error("Sealed store too short ({} bytes)", sealed.size());
        throw PersistenceError("Sealed store is truncated");
    }

    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(sealed.data());
    const unsigned char* salt = bytes + hdrLen;
    const unsigned char* nonce = salt + crypto_pwhash_SALTBYTES;
    const unsigned char* ciphertext = nonce + crypto_secretbox_NONCEBYTES;
    unsigned long long clen = sealed.size() - (ciphertext - bytes);

    std::vector<unsigned char> key = deriveKey(passphrase, salt);
    std::vector<unsigned char> plain(clen - crypto_secretbox_MACBYTES);

    int rc = crypto_secretbox_open_easy(plain.data(), ciphertext, clen, nonce, key.data());
    sodium_memzero(key.data(), key.size());
    if (rc != 0) {
        spdlog::error("Decryption failed");
        throw PersistenceError("Store decryption failed (wrong passphrase or corrupt file)");
    }

    return std::string(reinterpret_cast<const char*>(plain.data()), plain.size());
}

std::optional<std::string> Storage::readFile(const std::string& filename) {
    std::error_code ec;
    if (!fs::exists(filename, ec)) {
        if (ec) {
            spdlog::error("Cannot stat '{}': {}", filename, ec.message());
            throw PersistenceError("Cannot access '" + filename + "': " + ec.message());
        }
        return std::nullopt;
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::error("Failed to open '{}' for reading", filename);
        throw PersistenceError("Cannot open '" + filename + "' for reading");
    }

    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        spdlog::error("Read error on '{}'", filename);
        throw PersistenceError("Read error on '" + filename + "'");
    }
    return data;
}

void Storage::writeFileAtomic(const std::string& filename, const std::string& data) {
    fs::path target(filename);
    fs::path tmp = target;
    tmp += ".tmp." + std::to_string(::getpid());

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        spdlog::error("Failed to open '{}' for writing: {}", tmp.string(), errnoText());
        throw PersistenceError("Cannot write '" + tmp.string() + "': " + errnoText());
    }

    auto fail = [&](const std::string& what) {
        std::string reason = errnoText();
        ::close(fd);
        ::unlink(tmp.c_str());
        spdlog::error("{} '{}': {}", what, tmp.string(), reason);
        throw PersistenceError(what + " '" + tmp.string() + "': " + reason);
    };

    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("Write failed on");
        }
        p += n;
        left -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) fail("fsync failed on");

    if (::close(fd) != 0) {
        std::string reason = errnoText();
        ::unlink(tmp.c_str());
        throw PersistenceError("Close failed on '" + tmp.string() + "': " + reason);
    }

    if (::rename(tmp.c_str(), target.c_str()) != 0) {
        std::string reason = errnoText();
        ::unlink(tmp.c_str());
        spdlog::error("Failed to replace '{}': {}", filename, reason);
        throw PersistenceError("Cannot replace '" + filename + "': " + reason);
    }

    // make the rename itself durable
    fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd >= 0) {
        if (::fsync(dfd) != 0)
            spdlog::warn("fsync of directory '{}' failed: {}", dir.string(), errnoText());
        ::close(dfd);
    }
}

std::vector<Topic> Storage::loadTopics(const std::string& filename, const Ladder& ladder, const std::string& passphrase) {
    spdlog::debug("Loading topics from '{}'", filename);

    auto data = readFile(filename);
    if (!data) {
        spdlog::info("Store '{}' not found; treating as empty", filename);
        return {};
    }

    std::vector<Topic> topics;
    if (isSealed(*data)) {
        std::string plain = unseal(*data, passphrase);
        topics = parseTopics(plain, ladder);
        sodium_memzero(&plain[0], plain.size());
    }
    else {
        if (!passphrase.empty())
            spdlog::warn("Store '{}' is not encrypted; it will be sealed on next save", filename);
        topics = parseTopics(*data, ladder);
    }

    spdlog::info("Loaded {} topics", topics.size());
    return topics;
}

void Storage::saveTopics(const std::vector<Topic>& topics, const std::string& filename, const std::string& passphrase) {
    spdlog::info("Saving {} topics to '{}'", topics.size(), filename);

    std::string plain = serializeTopics(topics);
    if (passphrase.empty()) {
        writeFileAtomic(filename, plain);
        return;
    }

    std::string sealed = seal(plain, passphrase);
    sodium_memzero(&plain[0], plain.size());
    writeFileAtomic(filename, sealed);
}
