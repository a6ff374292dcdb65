#include "../../include/rules/rule_engine.hpp"
#include "../../include/errors.hpp"
#include <algorithm>
#include <functional>

namespace farkle::rules {

namespace {

// Face-count vectors packed in base 7, faces 1..6
constexpr int kTableSize = 7 * 7 * 7 * 7 * 7 * 7;

int encode(const FaceCounts& counts) {
    int index = 0;
    for (int face = 6; face >= 1; face--) {
        index = index * 7 + counts[face];
    }
    return index;
}

bool fits(const FaceCounts& part, const FaceCounts& whole) {
    for (int face = 1; face <= 6; face++) {
        if (part[face] > whole[face]) {
            return false;
        }
    }
    return true;
}

bool contains(const FaceCounts& outer, const FaceCounts& inner) {
    return fits(inner, outer);
}

// Best split of every multiset of up to six dice into disjoint movelets.
// Filled once, in order of increasing dice count, then read-only.
class PartitionTable {
public:
    struct Entry {
        int points;  // -1 when the multiset cannot be fully partitioned
        int first;   // movelet taken first in the best split
    };

    PartitionTable() : entries_(kTableSize, Entry{-1, -1}) {
        std::vector<std::vector<FaceCounts>> by_size(kMaxDice + 1);
        FaceCounts counts{};
        std::function<void(int, int)> enumerate = [&](int face, int used) {
            if (face > 6) {
                by_size[used].push_back(counts);
                return;
            }
            for (int n = 0; used + n <= kMaxDice; n++) {
                counts[face] = n;
                enumerate(face + 1, used + n);
            }
            counts[face] = 0;
        };
        enumerate(1, 0);

        entries_[0] = Entry{0, -1};
        const auto& table = movelets();
        for (int size = 1; size <= kMaxDice; size++) {
            for (const FaceCounts& c : by_size[size]) {
                Entry best{-1, -1};
                for (size_t i = 0; i < table.size(); i++) {
                    const Movelet& m = table[i];
                    if (!fits(m.consumes, c)) {
                        continue;
                    }
                    FaceCounts rest = c;
                    for (int face = 1; face <= 6; face++) {
                        rest[face] -= m.consumes[face];
                    }
                    int rest_points = entries_[encode(rest)].points;
                    if (rest_points < 0) {
                        continue;
                    }
                    if (m.points + rest_points > best.points) {
                        best = Entry{m.points + rest_points, static_cast<int>(i)};
                    }
                }
                entries_[encode(c)] = best;
            }
        }
    }

    const Entry& at(const FaceCounts& counts) const {
        return entries_[encode(counts)];
    }

private:
    std::vector<Entry> entries_;
};

const PartitionTable& partition_table() {
    static const PartitionTable table;
    return table;
}

Move make_move(const FaceCounts& kept) {
    const PartitionTable& table = partition_table();
    const auto& rules = movelets();

    Move move;
    move.kept = kept;
    move.dice_used = total_dice(kept);
    move.points = table.at(kept).points;

    FaceCounts rest = kept;
    while (total_dice(rest) > 0) {
        int index = table.at(rest).first;
        move.movelets.push_back(index);
        for (int face = 1; face <= 6; face++) {
            rest[face] -= rules[index].consumes[face];
        }
    }
    return move;
}

bool better_move(const Move& a, const Move& b) {
    if (a.points != b.points) {
        return a.points > b.points;
    }
    if (a.dice_used != b.dice_used) {
        return a.dice_used > b.dice_used;
    }
    return std::lexicographical_compare(b.kept.begin(), b.kept.end(),
                                        a.kept.begin(), a.kept.end());
}

FaceCounts validate_counts(const FaceCounts& counts) {
    for (int face = 1; face <= 6; face++) {
        if (counts[face] < 0) {
            throw InvalidRollError("Negative face count");
        }
    }
    int n = total_dice(counts);
    if (n < 1 || n > kMaxDice) {
        throw InvalidRollError("A roll needs between 1 and 6 dice, got " + std::to_string(n));
    }
    return counts;
}

} // namespace

int partition_score(const FaceCounts& counts) {
    for (int face = 1; face <= 6; face++) {
        if (counts[face] < 0) {
            return -1;
        }
    }
    if (total_dice(counts) > kMaxDice) {
        return -1;
    }
    return partition_table().at(counts).points;
}

Dice Move::kept_dice() const {
    Dice dice;
    for (int face = 1; face <= 6; face++) {
        for (int i = 0; i < kept[face]; i++) {
            dice.push_back(face);
        }
    }
    return dice;
}

std::string Move::describe() const {
    const auto& rules = farkle::rules::movelets();
    std::string text;
    for (int index : movelets) {
        if (!text.empty()) {
            text += " + ";
        }
        text += rules[index].name();
    }
    return text + " = " + std::to_string(points);
}

bool operator==(const Move& a, const Move& b) {
    return a.points == b.points && a.dice_used == b.dice_used && a.kept == b.kept;
}

FaceCounts RuleEngine::validate_roll(const Dice& dice) {
    if (dice.empty() || dice.size() > static_cast<size_t>(kMaxDice)) {
        throw InvalidRollError("A roll needs between 1 and 6 dice, got " +
                               std::to_string(dice.size()));
    }
    return count_faces(dice);
}

std::vector<Move> RuleEngine::legal_moves(const Dice& dice) const {
    return legal_moves_from_counts(validate_roll(dice));
}

std::vector<Move> RuleEngine::legal_moves_from_counts(const FaceCounts& roll) const {
    const FaceCounts counts = validate_counts(roll);
    const PartitionTable& table = partition_table();

    std::vector<Move> moves;
    FaceCounts kept{};
    std::function<void(int)> enumerate = [&](int face) {
        if (face > 6) {
            if (total_dice(kept) > 0 && table.at(kept).points >= 0) {
                moves.push_back(make_move(kept));
            }
            return;
        }
        for (int n = 0; n <= counts[face]; n++) {
            kept[face] = n;
            enumerate(face + 1);
        }
        kept[face] = 0;
    };
    enumerate(1);

    std::sort(moves.begin(), moves.end(), better_move);
    return moves;
}

std::vector<Move> RuleEngine::score_roll(const Dice& dice) const {
    std::vector<Move> all = legal_moves(dice);
    std::vector<Move> maximal;
    for (const Move& move : all) {
        bool extendable = std::any_of(all.begin(), all.end(), [&](const Move& other) {
            return other.dice_used > move.dice_used && contains(other.kept, move.kept);
        });
        if (!extendable) {
            maximal.push_back(move);
        }
    }
    return maximal;
}

std::optional<Move> RuleEngine::best_move(const Dice& dice) const {
    return best_move_from_counts(validate_roll(dice));
}

std::optional<Move> RuleEngine::best_move_from_counts(const FaceCounts& counts) const {
    std::vector<Move> moves = legal_moves_from_counts(counts);
    if (moves.empty()) {
        return std::nullopt;
    }
    return moves.front();
}

int RuleEngine::score_selection(const Dice& kept) const {
    int points = partition_table().at(validate_roll(kept)).points;
    return points < 0 ? 0 : points;
}

bool RuleEngine::has_scoring_potential(const Dice& dice) const {
    FaceCounts counts = validate_roll(dice);
    if (counts[1] > 0 || counts[5] > 0) {
        return true;
    }
    for (int face = 1; face <= 6; face++) {
        if (counts[face] >= 3) {
            return true;
        }
    }
    // Straights and three pairs need every die, so the full roll decides
    return partition_table().at(counts).points >= 0;
}

} // namespace farkle::rules
