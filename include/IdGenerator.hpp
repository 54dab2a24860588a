#ifndef IDGENERATOR_HPP
#define IDGENERATOR_HPP

#include <string>

namespace wattsim {

// Source of component ids. Injected into CircuitGraph so test graphs are reproducible.
class IdGenerator {
public:
    virtual ~IdGenerator() = default;
    virtual std::string next(const std::string& prefix) = 0;
};

// "<prefix>_1", "<prefix>_2", ... with one counter shared across prefixes
class SequentialIdGenerator : public IdGenerator {
public:
    explicit SequentialIdGenerator(unsigned long start = 1) : counter_(start) {}

    std::string next(const std::string& prefix) override {
        return prefix + "_" + std::to_string(counter_++);
    }

private:
    unsigned long counter_;
};

} // namespace wattsim

#endif // IDGENERATOR_HPP
