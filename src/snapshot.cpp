#include "snapshot.hpp"
#include <cstdio>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace savekeeper {

std::string to_string(SnapshotKind kind) {
    switch (kind) {
        case SnapshotKind::Automatic: return "automatic";
        case SnapshotKind::Manual:    return "manual";
        case SnapshotKind::Safety:    return "safety";
    }
    return "automatic";
}

std::optional<SnapshotKind> parse_snapshot_kind(const std::string& value) {
    if (value == "automatic") return SnapshotKind::Automatic;
    if (value == "manual") return SnapshotKind::Manual;
    if (value == "safety") return SnapshotKind::Safety;
    return std::nullopt;
}

std::string to_string(SnapshotFormat format) {
    return format == SnapshotFormat::Archive ? "archive" : "directory";
}

std::optional<SnapshotFormat> parse_snapshot_format(const std::string& value) {
    if (value == "directory") return SnapshotFormat::Directory;
    if (value == "archive") return SnapshotFormat::Archive;
    return std::nullopt;
}

SnapshotTime snapshot_now() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(SnapshotClock::now());
}

std::string format_snapshot_id(SnapshotTime time) {
    auto micros = time.time_since_epoch().count();
    std::time_t seconds = static_cast<std::time_t>(micros / 1000000);
    long fraction = static_cast<long>(micros % 1000000);
    if (fraction < 0) {
        fraction += 1000000;
        seconds -= 1;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d%02d%02d_%02d%02d%02d_%06ld",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, fraction);
    return buffer;
}

std::optional<SnapshotTime> parse_snapshot_id(const std::string& id) {
    // YYYYMMDD_HHMMSS_uuuuuu
    if (id.size() != 22 || id[8] != '_' || id[15] != '_') {
        return std::nullopt;
    }
    for (size_t i = 0; i < id.size(); i++) {
        if (i == 8 || i == 15) continue;
        if (!std::isdigit(static_cast<unsigned char>(id[i]))) return std::nullopt;
    }

    auto field = [&id](size_t pos, size_t len) { return std::stoi(id.substr(pos, len)); };

    std::tm utc{};
    utc.tm_year = field(0, 4) - 1900;
    utc.tm_mon = field(4, 2) - 1;
    utc.tm_mday = field(6, 2);
    utc.tm_hour = field(9, 2);
    utc.tm_min = field(11, 2);
    utc.tm_sec = field(13, 2);
    long micros = std::stol(id.substr(16, 6));

    if (utc.tm_mon < 0 || utc.tm_mon > 11 || utc.tm_mday < 1 || utc.tm_mday > 31 ||
        utc.tm_hour > 23 || utc.tm_min > 59 || utc.tm_sec > 60) {
        return std::nullopt;
    }

    std::time_t seconds = timegm(&utc);
    if (seconds == static_cast<std::time_t>(-1)) return std::nullopt;

    return SnapshotTime(std::chrono::microseconds(
        static_cast<int64_t>(seconds) * 1000000 + micros));
}

std::optional<std::string> snapshot_id_from_filename(const std::string& filename) {
    std::string stem = filename;
    std::string ext = ARCHIVE_EXTENSION;
    if (stem.size() > ext.size() && stem.compare(stem.size() - ext.size(), ext.size(), ext) == 0) {
        stem = stem.substr(0, stem.size() - ext.size());
    }
    if (!parse_snapshot_id(stem)) return std::nullopt;
    return stem;
}

SnapshotTime next_snapshot_time(SnapshotTime now, std::optional<SnapshotTime> newest_existing) {
    if (newest_existing && now <= *newest_existing) {
        return *newest_existing + std::chrono::microseconds(1);
    }
    return now;
}

std::string format_local_time(SnapshotTime time) {
    std::time_t seconds = SnapshotClock::to_time_t(
        std::chrono::time_point_cast<SnapshotClock::duration>(time));
    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);
    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace savekeeper
