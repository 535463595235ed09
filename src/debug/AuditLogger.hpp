//
// AuditLogger.hpp
//

#ifndef CARDARENA_AUDITLOGGER_HPP
#define CARDARENA_AUDITLOGGER_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include "../core/Messages.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace arena::core::debug
{
    // Line-oriented transcript of one peer's view of its sessions.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::filesystem::path path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]]
        auto is_open() const -> bool { return out_.is_open(); }

        // Session header (local name, peer, role, connection number)
        auto start(std::string_view session_id, std::string_view local_name, Connection const& link) -> void;

        auto phase(BattlePhase from, BattlePhase to) -> void;

        auto sent(std::uint64_t msg_id, Message const& m) -> void;
        auto received(std::uint64_t msg_id, Message const& m) -> void;

        // Absorbed problems (parse/payload/state), one line each
        auto dropped(std::string_view what) -> void;

        auto result(BattleResult const& r) -> void;

        // Session footer
        auto end(std::string_view reason) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };

    auto Describe(Message const& m) -> std::string;
}

#endif //CARDARENA_AUDITLOGGER_HPP
