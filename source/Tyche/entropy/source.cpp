#include <Tyche/entropy/source.hpp>
#include <regex>

namespace Tyche {

    const std::array<source, SourceCount> &all_sources () {
        static const std::array<source, SourceCount> Sources {
            source::system_time,
            source::crypto_secure,
            source::atmospheric,
            source::mathematical,
            source::quantum_sim,
            source::content_hash,
            source::temporal_drift};

        return Sources;
    }

    std::ostream &operator << (std::ostream &o, source s) {
        switch (s) {
            case source::system_time: return o << "system_time";
            case source::crypto_secure: return o << "crypto_secure";
            case source::atmospheric: return o << "atmospheric";
            case source::mathematical: return o << "mathematical";
            case source::quantum_sim: return o << "quantum_sim";
            case source::content_hash: return o << "content_hash";
            case source::temporal_drift: return o << "temporal_drift";
            default: return o << "invalid";
        }
    }

    source read_source (const std::string &name) {
        std::string sanitized = std::regex_replace (data::to_lower (name), std::regex {"_|-|\\s"}, "");

        if (sanitized == "systemtime") return source::system_time;
        if (sanitized == "cryptosecure") return source::crypto_secure;
        if (sanitized == "atmospheric") return source::atmospheric;
        if (sanitized == "mathematical") return source::mathematical;
        if (sanitized == "quantumsim") return source::quantum_sim;
        if (sanitized == "contenthash") return source::content_hash;
        if (sanitized == "temporaldrift") return source::temporal_drift;

        return source::invalid;
    }

    std::vector<source> read_sources (const std::string &csv) {
        std::vector<source> sources;
        std::stringstream ss {csv};
        std::string name;
        while (std::getline (ss, name, ',')) {
            source s = read_source (name);
            if (s != source::invalid) sources.push_back (s);
        }

        return sources;
    }

}
