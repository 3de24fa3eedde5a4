#include "dnsgate/state_file.hpp"
#include "dnsgate/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdio>
#include <fstream>
#include <sstream>

namespace dnsgate {

namespace {

std::string scalarOr(const YAML::Node& node, const char* key, const std::string& fallback) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    return value.as<std::string>();
}

} // namespace

Error StateFile::parse(const std::string& text, PersistedState* out) {
    PersistedState state;

    try {
        const YAML::Node root = YAML::Load(text);
        if (!root.IsMap()) {
            return Error::StateFileInvalid;
        }

        const YAML::Node list = root["rules"] ? root["rules"] : root["bloqueos"];

        if (list && !list.IsNull()) {
            if (!list.IsSequence()) {
                return Error::StateFileInvalid;
            }
            for (const auto& item : list) {
                if (!item.IsMap()) {
                    return Error::StateFileInvalid;
                }
                PersistedRule rule;
                rule.pattern = scalarOr(item, "pattern", "");
                rule.ip = scalarOr(item, "ip", "");
                rule.start = scalarOr(item, "start", "");
                rule.end = scalarOr(item, "end", "");
                const YAML::Node enabled = item["enabled"];
                rule.enabled = (enabled && !enabled.IsNull()) ? enabled.as<bool>() : true;
                state.rules.push_back(std::move(rule));
            }
        }

        const YAML::Node maintenance = root["maintenance"];
        if (maintenance && !maintenance.IsNull()) {
            state.maintenance = maintenance.as<bool>();
        }
    } catch (const YAML::Exception& e) {
        logging::get()->warn("state file parse error: {}", e.what());
        return Error::StateFileInvalid;
    }

    *out = std::move(state);
    return Error::Success;
}

Error StateFile::load(const std::string& path, PersistedState* out) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return Error::StateFileUnreadable;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error::StateFileUnreadable;
    }
    return parse(buffer.str(), out);
}

std::string StateFile::serialize(
    const RuleSnapshot& snapshot,
    bool maintenance,
    const std::vector<PersistedRule>& retained
) {
    // 流式 + 双引号输出即为合法 JSON
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetBoolFormat(YAML::TrueFalseBool);

    out << YAML::BeginMap;
    out << YAML::Key << "rules" << YAML::Value << YAML::BeginSeq;
    for (const auto& rule : snapshot.rules()) {
        out << YAML::BeginMap;
        out << YAML::Key << "pattern" << YAML::Value << rule.pattern();
        out << YAML::Key << "ip" << YAML::Value << rule.target().text;
        out << YAML::Key << "start" << YAML::Value << TimeWindow::formatClock(rule.window().start);
        out << YAML::Key << "end" << YAML::Value << TimeWindow::formatClock(rule.window().end);
        out << YAML::Key << "enabled" << YAML::Value << rule.enabled();
        out << YAML::EndMap;
    }
    for (const auto& rule : retained) {
        out << YAML::BeginMap;
        out << YAML::Key << "pattern" << YAML::Value << rule.pattern;
        out << YAML::Key << "ip" << YAML::Value << rule.ip;
        out << YAML::Key << "start" << YAML::Value << rule.start;
        out << YAML::Key << "end" << YAML::Value << rule.end;
        out << YAML::Key << "enabled" << YAML::Value << rule.enabled;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "maintenance" << YAML::Value << maintenance;
    out << YAML::EndMap;

    return std::string(out.c_str()) + "\n";
}

Error StateFile::save(
    const std::string& path,
    const RuleSnapshot& snapshot,
    bool maintenance,
    const std::vector<PersistedRule>& retained
) {
    std::string tmp = path + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            return Error::StateFileWriteFailed;
        }
        file << serialize(snapshot, maintenance, retained);
        file.flush();
        if (!file.good()) {
            return Error::StateFileWriteFailed;
        }
    }

    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::remove(tmp.c_str());
        return Error::StateFileWriteFailed;
    }
    return Error::Success;
}

SnapshotPtr StateFile::buildSnapshot(
    const PersistedState& state,
    std::vector<RejectedRule>* rejected
) {
    std::vector<Rule> rules;
    rules.reserve(state.rules.size());

    for (const auto& persisted : state.rules) {
        TimeWindow window;
        Error err = TimeWindow::parse(persisted.start, persisted.end, &window);

        std::optional<Rule> rule;
        if (err == Error::Success) {
            err = Rule::create(persisted.pattern, persisted.ip, window, persisted.enabled, &rule);
        }

        if (err != Error::Success) {
            if (rejected) {
                rejected->push_back(RejectedRule{persisted, err});
            }
            continue;
        }
        rules.push_back(std::move(*rule));
    }

    return std::make_shared<const RuleSnapshot>(std::move(rules), 0);
}

} // namespace dnsgate
