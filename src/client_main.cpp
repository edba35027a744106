#include "config.hpp"
#include "error.hpp"
#include "identity.hpp"
#include "local_bus.hpp"
#include "log.hpp"
#include "loop.hpp"
#include "manual_transport.hpp"
#include "mesh_coordinator.hpp"
#include "rtc_link.hpp"
#include "websocket_transport.hpp"

#include <spdlog/spdlog.h>

#include <getopt.h>

#include <condition_variable>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>

namespace {

struct Options {
    std::optional<std::string> configPath;
    std::optional<std::string> name;
    std::optional<std::string> serverUrl;
    std::optional<std::string> mode;
    std::optional<std::string> logLevel;
};

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config FILE] [--name NAME] [--server URL] [--mode server|local|manual] [--log-level LEVEL]"
              << std::endl;
}

void PrintHelp() {
    std::cout << "Commands:\n"
              << "  /rooms          list open rooms\n"
              << "  /join ID        join a room\n"
              << "  /create [ID]    create a room (random id if omitted)\n"
              << "  /peers          show connected peers\n"
              << "  /leave          leave the current room\n"
              << "  /offer          manual mode: start and print an offer blob\n"
              << "  /accept BLOB    manual mode: import a blob from the other side\n"
              << "  /quit           exit\n"
              << "Anything else is sent as a chat message." << std::endl;
}

std::optional<Options> ParseOptions(int argc, char* argv[]) {
    static const option longOptions[] = {
        {"config", required_argument, nullptr, 'c'},
        {"name", required_argument, nullptr, 'n'},
        {"server", required_argument, nullptr, 's'},
        {"mode", required_argument, nullptr, 'm'},
        {"log-level", required_argument, nullptr, 'l'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    Options options;
    int opt;
    while ((opt = getopt_long(argc, argv, "c:n:s:m:l:h", longOptions, nullptr)) != -1) {
        switch (opt) {
            case 'c': options.configPath = optarg; break;
            case 'n': options.name = optarg; break;
            case 's': options.serverUrl = optarg; break;
            case 'm': options.mode = optarg; break;
            case 'l': options.logLevel = optarg; break;
            default:
                PrintUsage(argv[0]);
                return std::nullopt;
        }
    }
    return options;
}

beam::ClientConfig BuildConfig(const Options& options) {
    auto config = options.configPath ? beam::LoadClientConfig(*options.configPath) : beam::ClientConfig{};

    if (options.name) {
        config.name = *options.name;
    }
    if (options.serverUrl) {
        config.serverUrl = *options.serverUrl;
    }
    if (options.mode) {
        config.mode = beam::ParseTransportMode(*options.mode);
    }
    if (options.logLevel) {
        beam::ParseLogLevel(*options.logLevel);
        config.logLevel = *options.logLevel;
    }
    return config;
}

std::string FormatTime(int64_t millis) {
    std::time_t seconds = millis / 1000;
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%H:%M");
    return out.str();
}

// Owns the chat session. Every method runs on the Loop thread.
class TerminalClient {
public:
    TerminalClient(beam::ClientConfig config, std::shared_ptr<beam::Loop> loop)
        : Config_(std::move(config))
        , Loop_(std::move(loop))
        , Identity_(beam::MakeIdentity(Config_.name))
        , Factory_(std::make_shared<beam::RtcLinkFactory>(Loop_, Config_.iceServers))
    { }

    // Throws Error{TransportUnavailable}.
    void Start() {
        std::cout << "You are " << Identity_.displayName << " (" << Identity_.id << "), "
                  << beam::ToString(Config_.mode) << " mode" << std::endl;

        switch (Config_.mode) {
            case beam::TransportMode::Server:
                Build(std::make_shared<beam::WebSocketTransport>(Loop_, Config_.serverUrl, Config_.connectTimeout));
                Coordinator_->Connect();
                Coordinator_->RequestRooms();
                break;
            case beam::TransportMode::Local: {
                auto bus = std::make_shared<beam::UdpBus>(Loop_, Config_.localBusGroup, Config_.localBusPort);
                Build(std::make_shared<beam::LocalBusTransport>(Loop_, bus));
                Coordinator_->Connect();
                break;
            }
            case beam::TransportMode::Manual:
                std::cout << "Type /offer to start, or /accept BLOB with a blob you were given." << std::endl;
                break;
        }
    }

    void Execute(const std::string& line) {
        try {
            Dispatch(line);
        } catch (const beam::Error& e) {
            std::cout << "Error: " << e.what() << std::endl;
        }
    }

    // Lobby refresh; only prints when the listing changed.
    void Poll() {
        if (Config_.mode == beam::TransportMode::Server && Coordinator_ && !InRoom()) {
            Coordinator_->RequestRooms();
        }
    }

    void Shutdown() {
        if (Coordinator_) {
            Coordinator_->Leave();
            Coordinator_.reset();
        }
        Manual_.reset();
    }

private:
    bool InRoom() const {
        return Coordinator_ && !Coordinator_->RoomId().empty();
    }

    void Dispatch(const std::string& line) {
        if (line.empty()) {
            return;
        }
        if (line[0] != '/') {
            SendChat(line);
            return;
        }

        std::istringstream in(line);
        std::string command;
        std::string argument;
        in >> command;
        std::getline(in >> std::ws, argument);

        if (command == "/help") {
            PrintHelp();
        } else if (command == "/rooms") {
            RequireMode(beam::TransportMode::Server, command);
            ForcePrintRooms_ = true;
            Coordinator_->RequestRooms();
        } else if (command == "/join") {
            if (argument.empty()) {
                std::cout << "Usage: /join ID" << std::endl;
                return;
            }
            RequireShared(command);
            Coordinator_->Join(argument);
        } else if (command == "/create") {
            RequireShared(command);
            auto roomId = Coordinator_->CreateOrJoin(argument);
            std::cout << "Creating room " << roomId << std::endl;
        } else if (command == "/peers") {
            PrintPeers();
        } else if (command == "/leave") {
            Leave();
        } else if (command == "/offer") {
            StartManual(beam::ManualRole::Creator);
        } else if (command == "/accept") {
            AcceptBlob(argument);
        } else {
            std::cout << "Unknown command " << command << ", try /help" << std::endl;
        }
    }

    void RequireMode(beam::TransportMode mode, const std::string& command) const {
        if (Config_.mode != mode) {
            throw beam::Error(beam::ErrorCode::InvalidConfig,
                              command + " needs " + beam::ToString(mode) + " mode");
        }
    }

    void RequireShared(const std::string& command) const {
        if (Config_.mode == beam::TransportMode::Manual) {
            throw beam::Error(beam::ErrorCode::InvalidConfig, command + " is not available in manual mode");
        }
    }

    void SendChat(const std::string& text) {
        if (!InRoom()) {
            std::cout << "Join a room first (/join ID or /create)" << std::endl;
            return;
        }

        auto message = Coordinator_->SendMessage(text);
        std::cout << "[" << FormatTime(message.timestamp) << "] me: " << message.text << std::endl;
        if (Coordinator_->Roster().empty()) {
            std::cout << "(nobody is connected yet, message not delivered)" << std::endl;
        }
    }

    void Leave() {
        if (!Coordinator_) {
            return;
        }
        Coordinator_->Leave();
        Connected_.clear();
        LastListing_.clear();
        std::cout << "Left the room" << std::endl;

        if (Config_.mode == beam::TransportMode::Manual) {
            Coordinator_.reset();
            Manual_.reset();
        }
    }

    void StartManual(beam::ManualRole role) {
        RequireMode(beam::TransportMode::Manual, "/offer");
        if (Coordinator_) {
            throw beam::Error(beam::ErrorCode::InvalidConfig, "A manual session is already running, /leave first");
        }

        Manual_ = std::make_shared<beam::ManualTransport>(Loop_, role);
        Build(Manual_);
        Coordinator_->Connect();
        Coordinator_->Join(beam::ManualTransport::kDefaultRoom);
        if (role == beam::ManualRole::Creator) {
            std::cout << "Gathering candidates, the offer blob follows..." << std::endl;
        }
    }

    void AcceptBlob(const std::string& blob) {
        RequireMode(beam::TransportMode::Manual, "/accept");
        if (blob.empty()) {
            std::cout << "Usage: /accept BLOB" << std::endl;
            return;
        }
        if (!Manual_) {
            StartManual(beam::ManualRole::Joiner);
        }
        Manual_->ImportBlob(blob);
        if (Manual_->Role() == beam::ManualRole::Joiner) {
            std::cout << "Offer accepted, the answer blob follows..." << std::endl;
        }
    }

    void Build(std::shared_ptr<beam::SignalingTransport> transport) {
        Coordinator_ = std::make_unique<beam::MeshCoordinator>(Identity_, std::move(transport), Factory_);

        Coordinator_->OnMessage([](const beam::ChatMessage& message) {
            std::cout << "[" << FormatTime(message.timestamp) << "] " << message.senderName << ": "
                      << message.text << std::endl;
        });
        Coordinator_->OnPeerJoin([](const beam::PeerRef& peer) {
            std::cout << "* " << (peer.peerName.empty() ? peer.peerId : peer.peerName) << " joined" << std::endl;
        });
        Coordinator_->OnPeerLeave([this](const beam::PeerRef& peer) {
            Connected_.erase(peer.peerId);
            std::cout << "* " << (peer.peerName.empty() ? peer.peerId : peer.peerName) << " left" << std::endl;
        });
        Coordinator_->OnPeerFailed([this](const beam::PeerRef& peer) {
            Connected_.erase(peer.peerId);
            std::cout << "* connection to " << (peer.peerName.empty() ? peer.peerId : peer.peerName) << " failed"
                      << std::endl;
        });
        Coordinator_->OnRosterChange([this](const std::vector<beam::PeerInfo>& roster) {
            std::set<std::string> current;
            for (const auto& peer : roster) {
                current.insert(peer.id);
                if (Connected_.insert(peer.id).second) {
                    std::cout << "* connected to " << (peer.name.empty() ? peer.id : peer.name) << std::endl;
                }
            }
            // A dropped channel is announced again once it reconnects.
            for (auto it = Connected_.begin(); it != Connected_.end();) {
                it = current.count(*it) ? std::next(it) : Connected_.erase(it);
            }
        });
        Coordinator_->OnRoomJoined([this](const std::string& roomId, const std::vector<beam::PeerRef>& peers) {
            if (Config_.mode == beam::TransportMode::Manual) {
                return;
            }
            std::cout << "Joined room " << roomId << " (" << peers.size() << " other peers)" << std::endl;
        });
        Coordinator_->OnRoomsList([this](const std::vector<beam::RoomSummary>& rooms) {
            PrintRooms(rooms);
        });
        Coordinator_->OnGatheringComplete([this](const std::string&) {
            if (!Manual_) {
                return;
            }
            std::cout << "Send this blob to the other side:\n" << Manual_->ExportBlob() << std::endl;
            if (Manual_->Role() == beam::ManualRole::Creator) {
                std::cout << "Then paste their reply with /accept BLOB" << std::endl;
            }
        });
    }

    void PrintRooms(const std::vector<beam::RoomSummary>& rooms) {
        std::ostringstream out;
        if (rooms.empty()) {
            out << "No open rooms, /create one";
        } else {
            out << "Open rooms:";
            for (const auto& room : rooms) {
                out << "\n  " << room.id << " (" << room.peerCount << " peers)";
                for (const auto& peer : room.peers) {
                    out << " " << peer.peerName;
                }
            }
        }

        auto listing = out.str();
        if (listing != LastListing_ || ForcePrintRooms_) {
            std::cout << listing << std::endl;
        }
        LastListing_ = std::move(listing);
        ForcePrintRooms_ = false;
    }

    void PrintPeers() const {
        if (!Coordinator_) {
            std::cout << "Not in a session" << std::endl;
            return;
        }
        auto roster = Coordinator_->Roster();
        if (roster.empty()) {
            std::cout << "No peers" << std::endl;
            return;
        }
        for (const auto& peer : roster) {
            std::cout << "  " << (peer.name.empty() ? "?" : peer.name) << " (" << peer.id << ") "
                      << beam::ToString(peer.state) << std::endl;
        }
    }

private:
    beam::ClientConfig Config_;
    std::shared_ptr<beam::Loop> Loop_;
    beam::PeerIdentity Identity_;
    std::shared_ptr<beam::LinkFactory> Factory_;

    std::unique_ptr<beam::MeshCoordinator> Coordinator_;
    std::shared_ptr<beam::ManualTransport> Manual_;

    std::set<std::string> Connected_;
    std::string LastListing_;
    bool ForcePrintRooms_ = false;
};

} // namespace

int main(int argc, char* argv[]) {
    auto options = ParseOptions(argc, argv);
    if (!options) {
        return 2;
    }

    beam::ClientConfig config;
    try {
        config = BuildConfig(*options);
        beam::InitLogging(config.logLevel);
    } catch (const beam::Error& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    if (config.name.empty()) {
        std::cout << "Enter your name: " << std::flush;
        std::getline(std::cin, config.name);
        if (config.name.empty()) {
            config.name = "anonymous";
        }
    }

    auto loop = std::make_shared<beam::Loop>();
    std::thread loopThread([loop] { loop->Run(); });

    TerminalClient client(config, loop);
    try {
        loop->Call([&client] { client.Start(); }).get();
    } catch (const beam::Error& e) {
        spdlog::critical("{}", e.what());
        loop->Stop();
        loopThread.join();
        return 1;
    }

    std::mutex pollMutex;
    std::condition_variable pollCv;
    bool quitting = false;
    std::thread pollThread([&] {
        std::unique_lock<std::mutex> lock(pollMutex);
        while (!pollCv.wait_for(lock, config.roomPollInterval, [&] { return quitting; })) {
            loop->EnqueueTask([&client] { client.Poll(); });
        }
    });

    PrintHelp();
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line == "/quit") {
            break;
        }
        loop->Call([&client, line] { client.Execute(line); }).get();
    }

    {
        std::lock_guard<std::mutex> lock(pollMutex);
        quitting = true;
    }
    pollCv.notify_all();
    pollThread.join();

    loop->Call([&client] { client.Shutdown(); }).get();
    loop->Stop();
    loopThread.join();
    return 0;
}
