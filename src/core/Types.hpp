//
// Types.hpp
//

#ifndef GUNZI_TYPES_HPP
#define GUNZI_TYPES_HPP

#define GZ_ALLOW_EXCEPTIONS true
#define GZ_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <vector>
#include <array>
#include <random>
#include <string>
#include <variant>
namespace gunzi::core::constants
{
    inline constexpr std::size_t SeatCount = 6;
    inline constexpr std::size_t TeamCount = 3;
    inline constexpr std::size_t DeckCopies = 4;
    inline constexpr std::size_t CardsPerDeck = 54;
    inline constexpr std::size_t DeckSize = DeckCopies * CardsPerDeck;
    inline constexpr std::size_t BottomSize = 6;
    inline constexpr std::size_t MaxTrickEntries = SeatCount;
    inline constexpr std::size_t MaxStructure = 4;
    // 5s, 10s and Kings over four decks
    inline constexpr std::uint16_t TotalPoints = 400;
    // accepted by the server's --kou-di-multiplier
    inline constexpr std::uint16_t MaxKouDiMultiplier = 100;
    // a team's settled points must still fit in 16 bits
    inline constexpr std::uint16_t MaxKouDiBonus = std::numeric_limits<std::uint16_t>::max() - TotalPoints;
}
namespace gunzi::core
{
    enum class Suit : uint8_t
    {
        Spades = 0,
        Hearts,
        Clubs,
        Diamonds,
        Joker
    };
    // Numeric values follow face value so level arithmetic stays readable.
    enum class Rank : uint8_t
    {
        Two = 2,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King,
        Ace,
        SmallJoker,
        BigJoker
    };

    using CardId = uint16_t;

    struct Card
    {
        Card() = delete;
        Card(CardId id, Suit suit, Rank rank) : id(id), suit(suit), rank(rank) {}

        CardId id;
        Suit suit;
        Rank rank;
        ///////////////////////////////////
        Card(Card const&) = delete;
        auto operator=(Card const&) -> Card& = delete;
    };
    // Rule equality: physical copy (id) never takes part.
    inline auto operator==(Card const& a, Card const& b) -> bool { return a.suit == b.suit && a.rank == b.rank; }
    using CardSP = std::shared_ptr<Card>;
    using CCardSP = std::shared_ptr<Card const>;

    // Value-side card for snapshots, events and the wire
    struct CardVal
    {
        CardId id{};
        Suit suit{};
        Rank rank{Rank::Two};
    };
    inline auto operator==(CardVal const& a, CardVal const& b) -> bool
    {
        return a.id == b.id && a.suit == b.suit && a.rank == b.rank;
    }

    using SeatIdxT = uint8_t;
    using TeamIdxT = uint8_t;
    using TeamScores = std::array<uint16_t, constants::TeamCount>;
    using TeamLevels = std::array<Rank, constants::TeamCount>;

    inline constexpr auto TeamOf(SeatIdxT const seat) noexcept -> TeamIdxT
    {
        return static_cast<TeamIdxT>(seat % constants::TeamCount);
    }

    struct RoomConfig
    {
        Rank     start_level{Rank::Two};
        // a catching team at or above this wins the round
        uint16_t catch_threshold{130};
        uint8_t  level_step{1};
        uint16_t kou_di_multiplier{2};
        uint64_t seed{std::random_device{}()};
    };
}

#endif //GUNZI_TYPES_HPP
