#ifndef DISKPROBE_PROBE_PROMPT_HPP
#define DISKPROBE_PROBE_PROMPT_HPP

#include <istream>
#include <ostream>
#include <string>

namespace diskprobe::probe {

// Asks the operator to acknowledge a warning before the run starts.
class ConfirmationPrompt {
public:
  virtual ~ConfirmationPrompt() = default;
  virtual void confirm(const std::string& message) = 0;
};

class NullPrompt : public ConfirmationPrompt {
public:
  void confirm(const std::string&) override {}
};

// Prints the message and blocks until a line (or EOF) arrives on input
class TerminalPrompt : public ConfirmationPrompt {
public:
  TerminalPrompt(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

  void confirm(const std::string& message) override;

private:
  std::istream& in_;
  std::ostream& out_;
};

// True when TMUX or STY is set in the environment
bool inside_multiplexer();

} // namespace diskprobe::probe

#endif // DISKPROBE_PROBE_PROMPT_HPP
