#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <mutex>
#include <string>
#include <unordered_map>


///////////////////////////
///     VALUE TABLE     ///
///////////////////////////
/**
 * @brief Learned mapping from move signatures to expected conflict reduction.
 *
 * Signatures are short strings describing the state and the move (conflict
 * kind, target period, load bin, move kind). Values follow
 * Q += alpha * (reward - Q). The table can be saved after a run and loaded
 * into the next one; a cold (empty) table makes repair fall back to the static
 * earliest-slot ranking. Thread-safe.
 */
class ValueTable {
public:
    ValueTable() = default;
    ValueTable(const ValueTable& other);
    ValueTable& operator=(const ValueTable& other);

    /// Value of a signature, 0 when unseen.
    double value(const std::string& signature) const;

    bool contains(const std::string& signature) const;

    /// Move the signature's value toward the reward.
    void update(const std::string& signature, double reward, double learningRate);

    bool empty() const;
    int size() const;
    void clear();

    /**
     * @brief Load "signature value" lines, replacing the current content.
     *
     * @return false when the file does not exist (the table stays empty).
     * @throws TimetableError on a malformed line.
     */
    bool load(const std::string& path);

    /**
     * @brief Write the table as "signature value" lines.
     *
     * @throws TimetableError when the file cannot be written.
     */
    void save(const std::string& path) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, double> values_;
};
