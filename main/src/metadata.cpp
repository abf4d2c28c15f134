#include "metadata.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "version.hpp"

#include <tinyxml2.h>

#include <algorithm>
#include <charconv>
#include <tuple>

namespace {
    void push_element(tinyxml2::XMLPrinter& printer, const char* name, const std::string& text) {
        printer.OpenElement(name);
        printer.PushText(text.c_str());
        printer.CloseElement();
    }

    std::string finish(tinyxml2::XMLPrinter& printer) {
        return std::string(printer.CStr(), static_cast<size_t>(printer.CStrSize() - 1));
    }

    std::vector<std::string> sorted_versions(std::vector<std::string> versions) {
        std::sort(versions.begin(), versions.end(), version_less);
        versions.erase(std::unique(versions.begin(), versions.end()), versions.end());
        return versions;
    }

    std::string element_text(const tinyxml2::XMLElement* element) {
        if (!element || !element->GetText()) {
            return "";
        }
        return element->GetText();
    }
}

std::string generate_artifact_metadata(const std::string& group_id, const std::string& artifact_id,
                                       const std::vector<std::string>& versions, const std::string& last_updated) {
    std::vector<std::string> ordered = sorted_versions(versions);

    tinyxml2::XMLPrinter printer;
    printer.PushHeader(false, true);
    printer.OpenElement("metadata");
    push_element(printer, "groupId", group_id);
    push_element(printer, "artifactId", artifact_id);
    printer.OpenElement("versioning");
    if (!ordered.empty()) {
        push_element(printer, "latest", latest_version(ordered));
    }
    if (std::string release = latest_release(ordered); !release.empty()) {
        push_element(printer, "release", release);
    }
    printer.OpenElement("versions");
    for (const auto& version : ordered) {
        push_element(printer, "version", version);
    }
    printer.CloseElement();
    push_element(printer, "lastUpdated", last_updated);
    printer.CloseElement();
    printer.CloseElement();
    return finish(printer);
}

std::string generate_group_metadata(const std::vector<PluginEntry>& plugins) {
    std::vector<PluginEntry> ordered = plugins;
    std::sort(ordered.begin(), ordered.end(),
              [](const PluginEntry& a, const PluginEntry& b) { return a.artifact_id < b.artifact_id; });
    ordered.erase(std::unique(ordered.begin(), ordered.end(),
                              [](const PluginEntry& a, const PluginEntry& b) { return a.artifact_id == b.artifact_id; }),
                  ordered.end());

    tinyxml2::XMLPrinter printer;
    printer.PushHeader(false, true);
    printer.OpenElement("metadata");
    printer.OpenElement("plugins");
    for (const auto& plugin : ordered) {
        printer.OpenElement("plugin");
        push_element(printer, "name", plugin.name);
        push_element(printer, "prefix", plugin.prefix);
        push_element(printer, "artifactId", plugin.artifact_id);
        printer.CloseElement();
    }
    printer.CloseElement();
    printer.CloseElement();
    return finish(printer);
}

std::string generate_version_metadata(const std::string& group_id, const std::string& artifact_id,
                                      const std::string& version, const SnapshotInfo& snapshot,
                                      const std::string& last_updated) {
    std::vector<SnapshotVersionEntry> entries = snapshot.entries;
    std::sort(entries.begin(), entries.end(), [](const SnapshotVersionEntry& a, const SnapshotVersionEntry& b) {
        return std::tie(a.extension, a.classifier) < std::tie(b.extension, b.classifier);
    });

    tinyxml2::XMLPrinter printer;
    printer.PushHeader(false, true);
    printer.OpenElement("metadata");
    push_element(printer, "groupId", group_id);
    push_element(printer, "artifactId", artifact_id);
    push_element(printer, "version", version);
    printer.OpenElement("versioning");
    printer.OpenElement("snapshot");
    push_element(printer, "timestamp", snapshot.timestamp);
    push_element(printer, "buildNumber", std::to_string(snapshot.build_number));
    printer.CloseElement();
    push_element(printer, "lastUpdated", last_updated);
    printer.OpenElement("snapshotVersions");
    for (const auto& entry : entries) {
        printer.OpenElement("snapshotVersion");
        if (entry.classifier) {
            push_element(printer, "classifier", *entry.classifier);
        }
        push_element(printer, "extension", entry.extension);
        push_element(printer, "value", entry.value);
        push_element(printer, "updated", entry.updated);
        printer.CloseElement();
    }
    printer.CloseElement();
    printer.CloseElement();
    printer.CloseElement();
    return finish(printer);
}

ParsedMetadata parse_metadata(std::string_view xml) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
        throw GhrelException(string_format("error.metadata_parse_failed", doc.ErrorStr() ? doc.ErrorStr() : ""));
    }
    const tinyxml2::XMLElement* root = doc.FirstChildElement("metadata");
    if (!root) {
        throw GhrelException(string_format("error.metadata_parse_failed", "<metadata>"));
    }

    ParsedMetadata parsed;
    if (const auto* versioning = root->FirstChildElement("versioning")) {
        if (const auto* versions = versioning->FirstChildElement("versions")) {
            for (const auto* v = versions->FirstChildElement("version"); v; v = v->NextSiblingElement("version")) {
                std::string text = element_text(v);
                if (!text.empty()) {
                    parsed.versions.push_back(text);
                }
            }
        }
        if (const auto* snapshot = versioning->FirstChildElement("snapshot")) {
            std::string build = element_text(snapshot->FirstChildElement("buildNumber"));
            int number = 0;
            auto res = std::from_chars(build.data(), build.data() + build.size(), number);
            if (!build.empty() && res.ec == std::errc() && res.ptr == build.data() + build.size()) {
                parsed.build_number = number;
            }
            std::string timestamp = element_text(snapshot->FirstChildElement("timestamp"));
            if (!timestamp.empty()) {
                parsed.snapshot_timestamp = timestamp;
            }
        }
    }
    if (const auto* plugins = root->FirstChildElement("plugins")) {
        for (const auto* p = plugins->FirstChildElement("plugin"); p; p = p->NextSiblingElement("plugin")) {
            PluginEntry entry;
            entry.name = element_text(p->FirstChildElement("name"));
            entry.prefix = element_text(p->FirstChildElement("prefix"));
            entry.artifact_id = element_text(p->FirstChildElement("artifactId"));
            if (!entry.artifact_id.empty()) {
                parsed.plugins.push_back(entry);
            }
        }
    }
    return parsed;
}
