#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// probability, seed or name field that cannot be parsed
class MalformedInputError : public std::runtime_error {
  public:
    explicit MalformedInputError(const std::string &msg)
        : std::runtime_error(msg) {}
};

// bracket shape doesn't allow resolving to a single champion
class StructuralError : public std::runtime_error {
  public:
    explicit StructuralError(const std::string &msg)
        : std::runtime_error(msg) {}
};

class HeaderMismatchError : public std::runtime_error {
  public:
    HeaderMismatchError(const std::string &found, const std::string &expected)
        : std::runtime_error("Header line doesn't match expected format\n"
                             "  found:    " +
                             found + "\n  expected: " + expected) {}
};

// attempt budget spent before enough runs produced the desired champion
class ConvergenceExhaustion : public std::runtime_error {
  public:
    ConvergenceExhaustion(const std::string &champion, int accepted,
                          int requested, long attempts)
        : std::runtime_error(
              "Desired champion " + champion + " won " +
              std::to_string(accepted) + " of " + std::to_string(requested) +
              " required runs within " + std::to_string(attempts) +
              " attempts"),
          accepted(accepted), requested(requested), attempts(attempts) {}

    int accepted;
    int requested;
    long attempts;
};

#endif // ERRORS_H
