/**
 * @file ClientApp.cpp
 * @brief Implementation of the ClientApp class.
 */
#include "app/ClientApp.hpp"

#include "domain/Errors.hpp"
#include "infrastructure/HttpTranscriptionClient.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <ostream>

namespace voicescribe::app {

namespace {

constexpr std::size_t kPreviewLength = 60;

std::string Preview(const std::string& text) {
    std::string line = text.substr(0, text.find('\n'));
    if (line.size() <= kPreviewLength) {
        return line;
    }
    // Back off to a UTF-8 boundary so the preview never ends mid-character.
    std::size_t cut = kPreviewLength;
    while (cut > 0 && (static_cast<unsigned char>(line[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return line.substr(0, cut) + "...";
}

} // namespace

ClientApp::ClientApp(const infrastructure::ClientConfig& config,
                     std::shared_ptr<domain::TranscriptionRepository> history,
                     std::ostream& out,
                     std::ostream& err)
    : m_config(config), m_history(std::move(history)), m_out(out), m_err(err) {}

void ClientApp::PrintUsage(std::ostream& os) {
    os << "usage: voicescribe-client [--server URL] [--config PATH] <command>\n"
       << "\n"
       << "commands:\n"
       << "  transcribe <file> [--sync]   transcribe an audio file and save it to history\n"
       << "  history                      list saved transcriptions, newest first\n"
       << "  show <id>                    print one saved transcription\n"
       << "  delete <id>                  delete one saved transcription\n";
}

int ClientApp::Run(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    bool synchronous = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--sync") {
            synchronous = true;
        } else if (arg == "--server" && i + 1 < args.size()) {
            m_config.serverUrl = args[++i];
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage(m_out);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            m_err << "error: unknown option " << arg << "\n";
            PrintUsage(m_err);
            return 2;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        PrintUsage(m_err);
        return 2;
    }

    const std::string& command = positional[0];
    if (command == "transcribe" && positional.size() == 2) {
        return transcribe(positional[1], synchronous);
    }
    if (command == "history" && positional.size() == 1) {
        return listHistory();
    }
    if (command == "show" && positional.size() == 2) {
        return show(positional[1]);
    }
    if (command == "delete" && positional.size() == 2) {
        return remove(positional[1]);
    }

    PrintUsage(m_err);
    return 2;
}

int ClientApp::transcribe(const std::string& filePath, bool synchronous) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        m_err << "error: cannot open " << filePath << "\n";
        return 1;
    }
    std::string audio((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (audio.empty()) {
        m_err << "error: " << filePath << " is empty\n";
        return 1;
    }

    infrastructure::HttpTranscriptionClient client(m_config.serverUrl, m_config.timeoutSeconds);
    std::string text;
    try {
        if (synchronous) {
            text = client.transcribe(audio);
        } else {
            std::size_t shown = 0;
            text = client.transcribeStream(audio, [this, &shown](const std::string& fullText) {
                if (fullText.size() > shown) {
                    m_err << fullText.substr(shown) << std::flush;
                    shown = fullText.size();
                }
            });
            if (shown > 0) {
                m_err << "\n";
            }
        }
    } catch (const domain::VoiceScribeError& e) {
        m_err << "error: " << e.what() << "\n";
        return 1;
    }

    if (text.empty()) {
        m_err << "No speech detected in the audio.\n";
        return 1;
    }

    domain::NewTranscription data;
    data.text = text;
    data.source = domain::TranscriptionRecord::Source::File;
    data.fileName = std::filesystem::path(filePath).filename().string();

    m_out << text << "\n";
    try {
        auto record = m_history->create(data);
        m_err << "Saved as " << record.id << "\n";
    } catch (const std::exception& e) {
        m_err << "warning: transcription not saved: " << e.what() << "\n";
    }
    return 0;
}

int ClientApp::listHistory() {
    auto records = m_history->list();
    if (records.empty()) {
        m_out << "No transcriptions yet.\n";
        return 0;
    }
    for (const auto& record : records) {
        m_out << record.id << "  " << record.createdAt << "  " << Preview(record.text) << "\n";
    }
    return 0;
}

int ClientApp::show(const std::string& id) {
    auto record = m_history->get(id);
    if (!record) {
        m_err << "error: no transcription with id " << id << "\n";
        return 1;
    }
    m_out << "id:      " << record->id << "\n"
          << "created: " << record->createdAt << "\n"
          << "source:  " << domain::TranscriptionRecord::SourceToString(record->source);
    if (record->fileName) {
        m_out << " (" << *record->fileName << ")";
    }
    m_out << "\n";
    if (record->duration) {
        m_out << "length:  " << *record->duration << "s\n";
    }
    m_out << "\n" << record->text << "\n";
    return 0;
}

int ClientApp::remove(const std::string& id) {
    try {
        if (!m_history->remove(id)) {
            m_err << "error: no transcription with id " << id << "\n";
            return 1;
        }
    } catch (const std::exception& e) {
        m_err << "error: " << e.what() << "\n";
        return 1;
    }
    m_out << "Deleted " << id << "\n";
    return 0;
}

} // namespace voicescribe::app
