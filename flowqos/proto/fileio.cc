#include "flowqos/proto/fileio.h"

#include <fcntl.h>

#include <cerrno>
#include <fstream>
#include <memory>

#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include "flowqos/posix/strerror.h"
#include "google/protobuf/io/tokenizer.h"
#include "google/protobuf/io/zero_copy_stream_impl.h"
#include "google/protobuf/text_format.h"
#include "google/protobuf/util/json_util.h"

namespace flowqos {

namespace {

class FirstErrorCollector : public google::protobuf::io::ErrorCollector {
 public:
  void AddError(int line, google::protobuf::io::ColumnNumber column,
                const std::string& message) override {
    if (first_.empty()) {
      first_ = absl::StrCat(line + 1, ":", column + 1, ": ", message);
    }
  }

  const std::string& first() const { return first_; }

 private:
  std::string first_;
};

}  // namespace

absl::Status ReadTextProtoFromFile(const std::string& path,
                                   google::protobuf::Message* out) {
  int fd;
  do {
    fd = open(path.c_str(), O_RDONLY);
  } while (fd == -1 && errno == EINTR);
  if (fd == -1) {
    return absl::NotFoundError(absl::StrCat(path, ": ", StrError(errno)));
  }
  google::protobuf::io::FileInputStream input(fd);
  input.SetCloseOnDelete(true);

  FirstErrorCollector errors;
  google::protobuf::TextFormat::Parser parser;
  parser.RecordErrorsTo(&errors);
  if (!parser.Parse(&input, out)) {
    return absl::InvalidArgumentError(absl::StrCat(path, ":", errors.first()));
  }
  return absl::OkStatus();
}

absl::Status WriteJsonLine(const google::protobuf::Message& mesg, FILE* out) {
  google::protobuf::util::JsonPrintOptions opt;
  opt.add_whitespace = false;
  opt.always_print_primitive_fields = true;

  std::string data;
  auto st = google::protobuf::util::MessageToJsonString(mesg, &data, opt);
  if (!st.ok()) {
    return absl::InvalidArgumentError(
        absl::StrCat("failed to encode ", mesg.GetTypeName(), ": ",
                     std::string(st.message())));
  }
  data.push_back('\n');

  if (fwrite(data.data(), 1, data.size(), out) != data.size()) {
    return absl::InternalError(StrError(errno));
  }
  return absl::OkStatus();
}

absl::Status ReadJsonLines(
    const std::string& path, const google::protobuf::Message& prototype,
    absl::FunctionRef<void(const google::protobuf::Message&)> on_record) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return absl::NotFoundError(absl::StrCat("failed to open ", path));
  }

  google::protobuf::util::JsonParseOptions opt;
  opt.ignore_unknown_fields = true;

  std::unique_ptr<google::protobuf::Message> record(prototype.New());
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    absl::string_view trimmed = absl::StripAsciiWhitespace(line);
    if (trimmed.empty()) {
      continue;
    }
    record->Clear();
    auto st =
        google::protobuf::util::JsonStringToMessage(std::string(trimmed), record.get(), opt);
    if (!st.ok()) {
      return absl::InvalidArgumentError(
          absl::StrCat(path, ":", lineno, ": ", std::string(st.message())));
    }
    on_record(*record);
  }
  return absl::OkStatus();
}

}  // namespace flowqos
