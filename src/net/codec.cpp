//
// codec.cpp
//
#include "codec.hpp"

#include <format>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace
{
    namespace fb = robotrace::gen::net;
    namespace core = robotrace::core;

    // Verify enum layouts (first and last values catch drift)
    static_assert((int)core::Phase::Menu == (int)fb::Phase::Menu);
    static_assert((int)core::Phase::Finished == (int)fb::Phase::Finished);
    static_assert((int)core::Attempt::Unattempted == (int)fb::Attempt::Unattempted);
    static_assert((int)core::Attempt::TimedOut == (int)fb::Attempt::TimedOut);
    static_assert((int)core::RuleVariant::OpenAnswer == (int)fb::Variant::OpenAnswer);
    static_assert((int)core::PlayerId::P2 == (int)fb::Player::P2);

    template <class E>
    inline auto InRange(E const v) noexcept -> bool
    {
        using U = std::underlying_type_t<E>;
        return static_cast<U>(v) >= static_cast<U>(E::MIN) && static_cast<U>(v) <= static_cast<U>(E::MAX);
    }

    inline auto SeatFromWire(std::uint8_t const p) -> std::optional<core::PlayerId>
    {
        if (p >= core::constants::PlayerCount) return std::nullopt;
        return static_cast<core::PlayerId>(p);
    }

    inline auto Seat(core::PlayerId const p) noexcept -> std::uint8_t
    {
        return static_cast<std::uint8_t>(core::IndexOf(p));
    }

    auto ToFbResolution(std::optional<core::ResolutionKind> const r) noexcept -> fb::Resolution
    {
        if (!r) return fb::Resolution::Pending;
        switch (*r)
        {
        case core::ResolutionKind::Correct: return fb::Resolution::Correct;
        case core::ResolutionKind::Incorrect: return fb::Resolution::Incorrect;
        case core::ResolutionKind::Skipped: return fb::Resolution::Skipped;
        case core::ResolutionKind::Timeout: return fb::Resolution::Timeout;
        case core::ResolutionKind::NobodyCorrect: return fb::Resolution::NobodyCorrect;
        }
        return fb::Resolution::Pending;
    }

    auto FromFbResolution(fb::Resolution const r) noexcept -> std::optional<core::ResolutionKind>
    {
        switch (r)
        {
        case fb::Resolution::Pending: return std::nullopt;
        case fb::Resolution::Correct: return core::ResolutionKind::Correct;
        case fb::Resolution::Incorrect: return core::ResolutionKind::Incorrect;
        case fb::Resolution::Skipped: return core::ResolutionKind::Skipped;
        case fb::Resolution::Timeout: return core::ResolutionKind::Timeout;
        case fb::Resolution::NobodyCorrect: return core::ResolutionKind::NobodyCorrect;
        }
        return std::nullopt;
    }

    auto Verified(std::span<std::byte const> bytes)
        -> std::expected<fb::Envelope const*, robotrace::net::ParseError>
    {
        using robotrace::net::ParseError;

        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<std::uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"buffer failed verification"});

        auto const* env = fb::GetEnvelope(data);
        if (!env || env->message_type() == fb::Message::NONE)
            return std::unexpected(ParseError{"empty envelope"});
        return env;
    }

    auto Finish(flatbuffers::FlatBufferBuilder& fbb, fb::Message const type, flatbuffers::Offset<void> const msg)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = fb::CreateEnvelope(fbb, type, msg);
        fbb.Finish(env);
        return fbb.Release();
    }
} // anonymous

namespace robotrace::net
{
    auto ToFbPhase(core::Phase const p) noexcept -> gen::net::Phase
    {
        switch (p)
        {
        case core::Phase::Menu: return gen::net::Phase::Menu;
        case core::Phase::Reading: return gen::net::Phase::Reading;
        case core::Phase::Buzzer: return gen::net::Phase::Buzzer;
        case core::Phase::BuzzerPause: return gen::net::Phase::BuzzerPause;
        case core::Phase::Answering: return gen::net::Phase::Answering;
        case core::Phase::Countdown: return gen::net::Phase::Countdown;
        case core::Phase::Question: return gen::net::Phase::Question;
        case core::Phase::Result: return gen::net::Phase::Result;
        case core::Phase::Finished: return gen::net::Phase::Finished;
        }
        return gen::net::Phase::Menu;
    }

    auto FromFbPhase(gen::net::Phase const p) noexcept -> core::Phase
    {
        switch (p)
        {
        case gen::net::Phase::Menu: return core::Phase::Menu;
        case gen::net::Phase::Reading: return core::Phase::Reading;
        case gen::net::Phase::Buzzer: return core::Phase::Buzzer;
        case gen::net::Phase::BuzzerPause: return core::Phase::BuzzerPause;
        case gen::net::Phase::Answering: return core::Phase::Answering;
        case gen::net::Phase::Countdown: return core::Phase::Countdown;
        case gen::net::Phase::Question: return core::Phase::Question;
        case gen::net::Phase::Result: return core::Phase::Result;
        case gen::net::Phase::Finished: return core::Phase::Finished;
        }
        return core::Phase::Menu;
    }

    auto ToFbPlayer(std::optional<core::PlayerId> const p) noexcept -> gen::net::Player
    {
        if (!p) return gen::net::Player::NoPlayer;
        return *p == core::PlayerId::P1 ? gen::net::Player::P1 : gen::net::Player::P2;
    }

    auto FromFbPlayer(gen::net::Player const p) noexcept -> std::optional<core::PlayerId>
    {
        switch (p)
        {
        case gen::net::Player::P1: return core::PlayerId::P1;
        case gen::net::Player::P2: return core::PlayerId::P2;
        case gen::net::Player::NoPlayer: break;
        }
        return std::nullopt;
    }

    auto PeekKind(std::span<std::byte const> bytes) -> std::expected<MessageKind, ParseError>
    {
        auto const env = Verified(bytes);
        if (!env) return std::unexpected(env.error());

        switch ((*env)->message_type())
        {
        case gen::net::Message::SnapshotMsg: return MessageKind::Snapshot;
        case gen::net::Message::InputMsg: return MessageKind::Input;
        case gen::net::Message::ActuatorMsg: return MessageKind::Actuator;
        default: break;
        }
        return std::unexpected(ParseError{"unknown message type"});
    }

    // ---------- Snapshot (server → display/input) ----------

    auto BuildSnapshot(core::SessionSnapshot const& snap, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        // children first, the builder below may not nest
        auto const prompt = fbb.CreateString(snap.prompt);

        std::vector<flatbuffers::Offset<flatbuffers::String>> opts;
        opts.reserve(snap.options.size());
        for (std::string const& o : snap.options)
        {
            opts.push_back(fbb.CreateString(o));
        }
        auto const opts_vec = fbb.CreateVector(opts);

        flatbuffers::Offset<flatbuffers::String> revealed{};
        if (snap.revealed_answer) revealed = fbb.CreateString(*snap.revealed_answer);

        std::vector<flatbuffers::Offset<gen::net::PlayerView>> players;
        players.reserve(snap.players.size());
        for (core::PlayerView const& p : snap.players)
        {
            players.push_back(gen::net::CreatePlayerView(
                fbb, static_cast<gen::net::Attempt>(p.attempt), p.score, p.track_position));
        }
        auto const players_vec = fbb.CreateVector(players);

        gen::net::SnapshotMsgBuilder b(fbb);
        b.add_msg_id(msg_id);
        b.add_phase(ToFbPhase(snap.phase));
        b.add_variant(static_cast<gen::net::Variant>(snap.variant));
        b.add_level(snap.level);
        b.add_has_question(snap.has_question);
        b.add_question_number(static_cast<std::uint32_t>(snap.question_number));
        b.add_questions_remaining(static_cast<std::uint32_t>(snap.questions_remaining));
        b.add_prompt(prompt);
        b.add_options(opts_vec);
        if (snap.revealed_index) b.add_revealed_index(static_cast<std::int8_t>(*snap.revealed_index));
        if (snap.revealed_answer) b.add_revealed_answer(revealed);
        if (snap.time_remaining) b.add_time_remaining_ms(snap.time_remaining->count());
        b.add_countdown(static_cast<std::uint8_t>(snap.countdown));
        b.add_buzzer_winner(ToFbPlayer(snap.buzzer_winner));
        b.add_round_winner(ToFbPlayer(snap.round_winner));
        b.add_resolution(ToFbResolution(snap.resolution));
        b.add_players(players_vec);
        if (snap.match)
        {
            b.add_match_state(snap.match->winner ? gen::net::MatchState::Won : gen::net::MatchState::Draw);
            b.add_match_winner(ToFbPlayer(snap.match->winner));
            b.add_match_reason(snap.match->reason == core::MatchEndReason::TrackCompleted
                                   ? gen::net::EndReason::TrackCompleted
                                   : gen::net::EndReason::BankExhausted);
        }
        auto const sm = b.Finish();

        return Finish(fbb, gen::net::Message::SnapshotMsg, sm.Union());
    }

    auto DecodeSnapshot(std::span<std::byte const> bytes) -> std::expected<core::SessionSnapshot, ParseError>
    {
        auto const env = Verified(bytes);
        if (!env) return std::unexpected(env.error());

        auto const* m = (*env)->message_as_SnapshotMsg();
        if (!m) return std::unexpected(ParseError{"not a SnapshotMsg"});

        if (!InRange(m->phase()) || !InRange(m->variant()))
            return std::unexpected(ParseError{"snapshot enum out of range"});

        core::SessionSnapshot out{};
        out.phase = FromFbPhase(m->phase());
        out.variant = static_cast<core::RuleVariant>(m->variant());
        out.level = m->level();
        out.has_question = m->has_question();
        out.question_number = m->question_number();
        out.questions_remaining = m->questions_remaining();
        if (m->prompt()) out.prompt = m->prompt()->str();

        if (auto const* v = m->options())
        {
            if (v->size() != core::constants::OptionCount)
                return std::unexpected(ParseError{std::format("expected {} options, got {}",
                                                              core::constants::OptionCount, v->size())});
            for (flatbuffers::uoffset_t i = 0; i < v->size(); ++i)
            {
                out.options[i] = v->Get(i)->str();
            }
        }

        if (m->revealed_index() >= 0)
        {
            if (static_cast<std::size_t>(m->revealed_index()) >= core::constants::OptionCount)
                return std::unexpected(ParseError{"revealed index out of range"});
            out.revealed_index = static_cast<std::size_t>(m->revealed_index());
        }
        if (m->revealed_answer()) out.revealed_answer = m->revealed_answer()->str();

        if (m->time_remaining_ms() >= 0) out.time_remaining = core::Millis{m->time_remaining_ms()};
        out.countdown = m->countdown();

        out.buzzer_winner = FromFbPlayer(m->buzzer_winner());
        out.round_winner = FromFbPlayer(m->round_winner());
        out.resolution = FromFbResolution(m->resolution());

        if (auto const* v = m->players())
        {
            if (v->size() != core::constants::PlayerCount)
                return std::unexpected(ParseError{"snapshot must carry both players"});
            for (flatbuffers::uoffset_t i = 0; i < v->size(); ++i)
            {
                auto const* pv = v->Get(i);
                if (!InRange(pv->attempt()))
                    return std::unexpected(ParseError{"attempt out of range"});
                out.players[i].attempt = static_cast<core::Attempt>(pv->attempt());
                out.players[i].score = pv->score();
                out.players[i].track_position = pv->track_position();
            }
        }

        if (m->match_state() != gen::net::MatchState::Undecided)
        {
            out.match = core::MatchResult{
                .winner = FromFbPlayer(m->match_winner()),
                .reason = m->match_reason() == gen::net::EndReason::TrackCompleted
                              ? core::MatchEndReason::TrackCompleted
                              : core::MatchEndReason::BankExhausted
            };
        }
        return out;
    }

    // ---------- Input (input peer → server) ----------

    auto BuildInput(core::PlayerAction const& action, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        auto const [type, input] = std::visit(
            [&]<typename T0>(T0 const& act) -> std::pair<gen::net::Input, flatbuffers::Offset<void>>
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, core::ClaimBuzzerAction>)
                    return {gen::net::Input::Input_ClaimBuzzer,
                            gen::net::CreateInput_ClaimBuzzer(fbb, Seat(act.player)).Union()};
                else if constexpr (std::is_same_v<T, core::SelectOptionAction>)
                {
                    if (act.index > UINT8_MAX)
                        RR_THROW(core::error::Code::Serialization, "option index does not fit the wire");
                    return {gen::net::Input::Input_SelectOption,
                            gen::net::CreateInput_SelectOption(fbb, Seat(act.player),
                                                               static_cast<std::uint8_t>(act.index)).Union()};
                }
                else if constexpr (std::is_same_v<T, core::SkipAction>)
                    return {gen::net::Input::Input_Skip,
                            gen::net::CreateInput_Skip(fbb, Seat(act.player)).Union()};
                else if constexpr (std::is_same_v<T, core::SelectLevelAction>)
                    return {gen::net::Input::Input_SelectLevel,
                            gen::net::CreateInput_SelectLevel(fbb, act.level).Union()};
                else if constexpr (std::is_same_v<T, core::CancelAction>)
                    return {gen::net::Input::Input_Cancel, gen::net::CreateInput_Cancel(fbb).Union()};
                else
                    return {gen::net::Input::Input_Restart, gen::net::CreateInput_Restart(fbb).Union()};
            },
            action);

        auto const msg = gen::net::CreateInputMsg(fbb, msg_id, type, input);
        return Finish(fbb, gen::net::Message::InputMsg, msg.Union());
    }

    auto DecodeInput(std::span<std::byte const> bytes) -> std::expected<core::PlayerAction, ParseError>
    {
        auto const env = Verified(bytes);
        if (!env) return std::unexpected(env.error());

        auto const* m = (*env)->message_as_InputMsg();
        if (!m) return std::unexpected(ParseError{"not an InputMsg"});

        auto seat = [](std::uint8_t const p) -> std::expected<core::PlayerId, ParseError>
        {
            if (auto const s = SeatFromWire(p)) return *s;
            return std::unexpected(ParseError{std::format("no player seat {}", p)});
        };

        switch (m->input_type())
        {
        case gen::net::Input::Input_ClaimBuzzer:
        {
            auto const p = seat(m->input_as_Input_ClaimBuzzer()->player());
            if (!p) return std::unexpected(p.error());
            return core::ClaimBuzzerAction{*p};
        }
        case gen::net::Input::Input_SelectOption:
        {
            auto const* s = m->input_as_Input_SelectOption();
            auto const p = seat(s->player());
            if (!p) return std::unexpected(p.error());
            return core::SelectOptionAction{*p, s->index()};
        }
        case gen::net::Input::Input_Skip:
        {
            auto const p = seat(m->input_as_Input_Skip()->player());
            if (!p) return std::unexpected(p.error());
            return core::SkipAction{*p};
        }
        case gen::net::Input::Input_SelectLevel:
            return core::SelectLevelAction{m->input_as_Input_SelectLevel()->level()};
        case gen::net::Input::Input_Cancel:
            return core::CancelAction{};
        case gen::net::Input::Input_Restart:
            return core::RestartAction{};
        default:
            break;
        }
        return std::unexpected(ParseError{"unknown input variant"});
    }

    // ---------- Actuator (server → robot bridge) ----------

    auto BuildAdvance(core::PlayerId const player, int const distance, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = gen::net::CreateActuatorMsg(
            fbb, msg_id, gen::net::ActuatorCommand::Advance, Seat(player), distance);
        return Finish(fbb, gen::net::Message::ActuatorMsg, m.Union());
    }

    auto BuildCelebrate(core::PlayerId const player, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = gen::net::CreateActuatorMsg(
            fbb, msg_id, gen::net::ActuatorCommand::Celebrate, Seat(player), 0);
        return Finish(fbb, gen::net::Message::ActuatorMsg, m.Union());
    }

    auto DecodeActuatorCommand(std::span<std::byte const> bytes) -> std::expected<ActuatorCommand, ParseError>
    {
        auto const env = Verified(bytes);
        if (!env) return std::unexpected(env.error());

        auto const* m = (*env)->message_as_ActuatorMsg();
        if (!m) return std::unexpected(ParseError{"not an ActuatorMsg"});

        auto const p = SeatFromWire(m->player());
        if (!p) return std::unexpected(ParseError{std::format("no player seat {}", m->player())});

        ActuatorCommand out{.player = *p, .distance = m->distance(), .msg_id = m->msg_id()};
        switch (m->command())
        {
        case gen::net::ActuatorCommand::Advance:
            if (m->distance() < 0) return std::unexpected(ParseError{"negative advance"});
            out.kind = ActuatorCommand::Kind::Advance;
            return out;
        case gen::net::ActuatorCommand::Celebrate:
            out.kind = ActuatorCommand::Kind::Celebrate;
            return out;
        }
        return std::unexpected(ParseError{"unknown actuator command"});
    }
} // namespace robotrace::net
