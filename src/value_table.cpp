///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "value_table.hpp"
#include "errors.hpp"
#include <fstream>
#include <map>
#include <sstream>


///////////////////////////
///     VALUE TABLE     ///
///////////////////////////
ValueTable::ValueTable(const ValueTable& other) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    values_ = other.values_;
}

ValueTable& ValueTable::operator=(const ValueTable& other) {
    if (this == &other) return *this;
    std::unordered_map<std::string, double> copy;
    {
        std::lock_guard<std::mutex> lock(other.mutex_);
        copy = other.values_;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    values_.swap(copy);
    return *this;
}

double ValueTable::value(const std::string& signature) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(signature);
    return it == values_.end() ? 0.0 : it->second;
}

bool ValueTable::contains(const std::string& signature) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.count(signature) > 0;
}

void ValueTable::update(const std::string& signature, double reward, double learningRate) {
    std::lock_guard<std::mutex> lock(mutex_);
    double& q = values_[signature];
    q += learningRate * (reward - q);
}

bool ValueTable::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.empty();
}

int ValueTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return (int)values_.size();
}

void ValueTable::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

bool ValueTable::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) return false;

    std::unordered_map<std::string, double> loaded;
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty() || line[0] == '#') continue;
        std::istringstream fields(line);
        std::string signature;
        double value;
        if (!(fields >> signature >> value)) {
            throw TimetableError("value table " + path + ": malformed line " + std::to_string(lineNo));
        }
        loaded[signature] = value;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    values_.swap(loaded);
    return true;
}

void ValueTable::save(const std::string& path) const {
    std::map<std::string, double> sorted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sorted.insert(values_.begin(), values_.end());
    }
    std::ofstream out(path);
    if (!out) throw TimetableError("value table " + path + ": cannot open for writing");
    out.precision(17);
    for (const auto& entry : sorted) out << entry.first << " " << entry.second << "\n";
    if (!out) throw TimetableError("value table " + path + ": write failed");
}
