#include "delim_scanner/dsv_parser.hpp"
#include "delim_scanner/encoding.hpp"
#include <algorithm>
#include <iostream>

namespace ds {

namespace {

constexpr unsigned char LF = '\n';

bool contains_any(std::string_view s, char a, char b, char c) {
  return std::any_of(s.begin(), s.end(), [&](char x){ return x == a || x == b || x == c; });
}

}

struct DsvParser::Impl {
  DsvConfig cfg;
  Automaton fsm;

  State state{State::FieldStart};
  std::string field;
  Record record;
  Record header;
  std::uint64_t line{1};
  std::uint64_t column{0};
  std::optional<Checkpoint> checkpoint;
  std::string parsed;

  bool header_pending{false};
  bool bom_pending{true};
  std::string bom_head; // leading bytes held while they still match kUtf8Bom

  // Absolute byte offsets. `carry` holds bytes [line_start, offset) of the
  // current line that arrived in earlier chunks, at most max_error_input of
  // them; only error reports read it.
  std::uint64_t offset{0};
  std::uint64_t line_start{0};
  std::string carry;

  explicit Impl(DsvConfig c) { configure(std::move(c)); }

  void configure(DsvConfig c) {
    validate(c);
    if (!c.on_error) {
      c.on_error = [](const ErrorInfo& e) {
        std::cerr << "[dsv] line " << e.line << ":" << e.column
                  << " malformed field (" << state_name(e.state) << "): "
                  << e.input << "\n";
      };
    }
    if (!c.on_record) {
      c.on_record = [this](const Record& r, std::uint64_t) { return serialize(r) + "\n"; };
    }
    Automaton built = build_automaton(c);
    cfg = std::move(c);
    fsm = std::move(built);
    clear();
  }

  void clear() {
    state = State::FieldStart;
    field.clear();
    record.clear();
    header.clear();
    line = 1;
    column = 0;
    checkpoint.reset();
    parsed.clear();
    header_pending = static_cast<bool>(cfg.on_header) || static_cast<bool>(cfg.on_header_field);
    bom_pending = true;
    bom_head.clear();
    offset = 0;
    line_start = 0;
    carry.clear();
  }

  const FieldCallback& field_callback() const {
    return header_pending ? cfg.on_header_field : cfg.on_field;
  }

  // --- commits: bookkeeping first, callbacks last ---------------------------

  void commit_field() {
    const std::size_t index = record.size();
    record.push_back(decode_field(field, cfg.encoding));
    field.clear();
    if (const auto& cb = field_callback()) cb(record.back(), index, line);
  }

  void commit_record(std::uint64_t next_line_start) {
    record.push_back(decode_field(field, cfg.encoding));
    field.clear();
    Record done;
    done.swap(record);
    const std::uint64_t at = line++;
    column = 0;
    line_start = next_line_start;

    const bool is_header = header_pending;
    if (const auto& cb = field_callback()) cb(done.back(), done.size() - 1, at);
    header_pending = false;

    if (!is_header) {
      parsed += cfg.on_record(done, at);
      return;
    }
    header = std::move(done);
    if (cfg.on_header) parsed += cfg.on_header(header, at);
  }

  // Text of the current line up to (not including) absolute offset `end`,
  // cut to max_error_input bytes.
  std::string line_text(std::string_view chunk, std::uint64_t base, std::uint64_t end) const {
    std::string s;
    if (line_start < base) {
      s = carry;
      if (carry.size() == base - line_start)
        s.append(chunk.substr(0, static_cast<std::size_t>(end - base)));
    } else {
      s.assign(chunk.substr(static_cast<std::size_t>(line_start - base),
                            static_cast<std::size_t>(end - line_start)));
    }
    if (cfg.max_error_input && s.size() > cfg.max_error_input) s.resize(cfg.max_error_input);
    return s;
  }

  ErrorInfo take_error(std::string_view chunk, std::uint64_t base, std::uint64_t end,
                       State from, std::uint64_t next_line_start) {
    std::string raw = line_text(chunk, base, end);
    if (from == State::SkipToEolAfterCr && raw.size() == end - line_start &&
        !raw.empty() && raw.back() == '\r')
      raw.pop_back();

    ErrorInfo e;
    e.line = line;
    if (checkpoint) {
      const std::size_t skip = static_cast<std::size_t>(
          std::min<std::uint64_t>(checkpoint->offset - line_start, raw.size()));
      e.span   = decode_field(std::string_view(raw).substr(skip), cfg.encoding);
      e.column = checkpoint->column;
      e.state  = checkpoint->state;
      e.offset = checkpoint->offset;
    } else {
      e.span   = decode_field(raw, cfg.encoding);
      e.column = column;
      e.state  = from;
      e.offset = line_start;
    }
    e.input = decode_field(raw, cfg.encoding);

    ++line;
    column = 0;
    field.clear();
    record.clear();
    checkpoint.reset();
    line_start = next_line_start;
    return e;
  }

  void keep_carry(std::string_view chunk, std::uint64_t base, std::size_t end) {
    std::string_view keep = chunk.substr(0, end);
    if (line_start >= base) {
      keep.remove_prefix(static_cast<std::size_t>(std::min<std::uint64_t>(line_start - base, end)));
      carry.clear();
    }
    if (cfg.max_error_input)
      keep = keep.substr(0, cfg.max_error_input - std::min(cfg.max_error_input, carry.size()));
    carry.append(keep);
    offset = base + end;
  }

  // --- scan loop ------------------------------------------------------------

  // Holds leading bytes while they may still be a BOM, so the decision does
  // not depend on where the first chunk ends.
  void scan(std::string_view chunk) {
    if (chunk.empty()) return;
    if (!bom_pending || !cfg.strip_bom) {
      bom_pending = false;
      scan_bytes(chunk, 0);
      return;
    }
    std::string head = bom_head;
    bom_head.append(chunk.substr(0, std::min(kUtf8Bom.size() - head.size(), chunk.size())));
    const bool prefix = kUtf8Bom.compare(0, bom_head.size(), bom_head) == 0;
    if (prefix && bom_head.size() < kUtf8Bom.size()) return;

    bom_pending = false;
    bom_head.clear();
    const std::size_t skip = prefix ? kUtf8Bom.size() : 0;
    if (head.empty()) {
      scan_bytes(chunk, skip);
    } else {
      head.append(chunk);
      scan_bytes(head, skip);
    }
  }

  void scan_bytes(std::string_view chunk, std::size_t skip) {
    const std::uint64_t base = offset;
    std::size_t pos = skip;
    if (skip && line_start == base) line_start = base + skip;

    try {
      // Pushback steps `pos` back by one; the unsigned wrap at 0 is undone by ++pos.
      for (; pos < chunk.size(); ++pos) {
        const unsigned char c = static_cast<unsigned char>(chunk[pos]);
        if (c != LF) ++column;

        const Rule& r = fsm.lookup(state, c);
        const State from = state;
        state = r.next;

        switch (r.action) {
          case Action::Append:
            field.push_back(static_cast<char>(c));
            break;
          case Action::NoOp:
            // LF closing a CRLF pair belongs to the line the CR ended.
            if (c == LF && line_start == base + pos) line_start = base + pos + 1;
            break;
          case Action::Pushback:
            if (column > 0) --column;
            --pos;
            break;
          case Action::CommitField:
            commit_field();
            break;
          case Action::CommitRecord:
            commit_record(base + pos + 1);
            break;
          case Action::Checkpoint:
            checkpoint = Checkpoint{from, column, base + pos};
            break;
          case Action::RaiseError: {
            ErrorInfo e = take_error(chunk, base, base + pos, from, base + pos + 1);
            cfg.on_error(e);
            break;
          }
          case Action::RaiseErrorPushback: {
            ErrorInfo e = take_error(chunk, base, base + pos, from, base + pos);
            --pos;
            cfg.on_error(e);
            break;
          }
        }
      }
    } catch (...) {
      // A callback threw: the byte under the cursor is consumed, the rest of
      // the chunk is not. Keep the session consistent and let it propagate.
      keep_carry(chunk, base, std::min(pos + 1, chunk.size()));
      throw;
    }
    keep_carry(chunk, base, chunk.size());
  }

  bool finish() {
    parsed.clear();
    if (bom_pending && !bom_head.empty()) {
      // Stream ended inside what looked like a BOM: the bytes are data.
      const std::string head = std::move(bom_head);
      bom_head.clear();
      bom_pending = false;
      scan_bytes(head, 0);
    }
    bom_pending = false;
    const State from = state;
    bool ok = fsm.accepting(from);
    const bool pending = from != State::AfterCr &&
                         !(from == State::FieldStart && record.empty() && field.empty());

    state = State::FieldStart;
    if (ok) {
      if (pending) commit_record(offset);
    } else if (from == State::SkipToEol || from == State::SkipToEolAfterCr ||
               cfg.report_unterminated) {
      ErrorInfo e = take_error(std::string_view{}, offset, offset, from, offset);
      cfg.on_error(e);
    } else {
      field.clear();
      record.clear();
    }
    checkpoint.reset();
    carry.clear();
    line_start = offset;
    return ok;
  }

  std::string serialize(const Record& rec) const {
    const char d = cfg.delimiter[0];
    std::string out;
    if (cfg.quote.empty()) {
      for (std::size_t i = 0; i < rec.size(); ++i) {
        if (contains_any(rec[i], d, '\r', '\n'))
          throw SerializeError("field " + std::to_string(i) +
                               " contains the delimiter or a line break and quoting is disabled");
        if (i) out.push_back(d);
        out += encode_text(rec[i], cfg.encoding);
      }
      return out;
    }
    const char q = cfg.quote[0];
    out.push_back(q);
    for (std::size_t i = 0; i < rec.size(); ++i) {
      if (i) { out.push_back(q); out.push_back(d); out.push_back(q); }
      for (char ch : encode_text(rec[i], cfg.encoding)) {
        if (ch == q) out.push_back(q);
        out.push_back(ch);
      }
    }
    out.push_back(q);
    return out;
  }
};

DsvParser::DsvParser() : DsvParser(DsvConfig{}) {}
DsvParser::DsvParser(DsvConfig cfg) : p_(new Impl(std::move(cfg))) {}
DsvParser::DsvParser(DsvParser&& other) noexcept : p_(other.p_) { other.p_ = nullptr; }
DsvParser& DsvParser::operator=(DsvParser&& other) noexcept {
  std::swap(p_, other.p_);
  return *this;
}
DsvParser::~DsvParser() { delete p_; }

void DsvParser::reset() { p_->clear(); }
void DsvParser::reset(DsvConfig cfg) { p_->configure(std::move(cfg)); }

const std::string& DsvParser::feed(std::string_view chunk) {
  p_->parsed.clear();
  p_->scan(chunk);
  return p_->parsed;
}

bool DsvParser::finish() { return p_->finish(); }
std::string DsvParser::serialize(const Record& record) const { return p_->serialize(record); }

char DsvParser::delimiter() const noexcept { return p_->cfg.delimiter[0]; }
std::optional<char> DsvParser::quote() const noexcept {
  if (p_->cfg.quote.empty()) return std::nullopt;
  return p_->cfg.quote[0];
}
bool DsvParser::quote_required() const noexcept { return !p_->cfg.quote.empty() && p_->cfg.quote_required; }
Encoding DsvParser::encoding() const noexcept { return p_->cfg.encoding; }

std::uint64_t DsvParser::line() const noexcept { return p_->line; }
std::uint64_t DsvParser::column() const noexcept { return p_->column; }
const std::string& DsvParser::field() const noexcept { return p_->field; }
const Record& DsvParser::record() const noexcept { return p_->record; }
State DsvParser::state() const noexcept { return p_->state; }
bool DsvParser::accepting() const noexcept { return p_->fsm.accepting(p_->state); }
const std::optional<Checkpoint>& DsvParser::checkpoint() const noexcept { return p_->checkpoint; }
const Record& DsvParser::header() const noexcept { return p_->header; }
const std::string& DsvParser::parsed() const noexcept { return p_->parsed; }
std::uint64_t DsvParser::bytes_consumed() const noexcept { return p_->offset; }
const Automaton& DsvParser::automaton() const noexcept { return p_->fsm; }

}
