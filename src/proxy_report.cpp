// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "proxy_report.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <sstream>
#include <variant>

namespace strix {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void write_traffic_class(rapidjson::Writer<rapidjson::StringBuffer>& writer,
                         const ProxyConfig& config, TrafficClass traffic) {
    writer.Key(to_string(traffic).data());
    writer.StartObject();

    writer.Key("proxy");
    if (const auto& proxy = config.effective_proxy_url(traffic)) {
        writer.String(proxy->redacted().c_str());
    } else {
        writer.Null();
    }

    writer.Key("route");
    writer.String(route_kind(config.route(traffic)).data());

    if (traffic == TrafficClass::Llm) {
        writer.Key("exported_env");
        writer.StartArray();
        for (const auto& entry : config.to_llm_client_env()) {
            writer.String(entry.first.c_str());
        }
        writer.EndArray();
    }

    writer.EndObject();
}

// Wrap in single quotes; embedded quotes become '\''
std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace

std::string_view route_kind(const ProxyRoute& route) {
    return std::visit(overloaded{[](const NoProxy&) { return std::string_view("none"); },
                                 [](const SimpleProxy&) { return std::string_view("simple"); },
                                 [](const SocksProxy&) { return std::string_view("socks"); }},
                      route);
}

std::string render_json_report(const ProxyConfig& config) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    write_traffic_class(writer, config, TrafficClass::Tools);
    write_traffic_class(writer, config, TrafficClass::Llm);
    writer.EndObject();
    return buffer.GetString();
}

std::string render_shell_exports(const ProxyConfig& config) {
    std::ostringstream out;
    for (const auto& [name, value] : config.to_llm_client_env()) {
        out << "export " << name << "=" << shell_quote(value) << "\n";
    }
    return out.str();
}

} // namespace strix
