#include <format>
#include <fstream>
#include <iostream>

#include "cbor_encode.hpp"
#include "cbor_writer_errors.hpp"
#include "json_transfer.hpp"

namespace cbor_stream {

auto transferUsage() -> std::string {
    return "usage: json2cbor <input.json|-> <output.cbor|-> [--indefinite] [--log-endpoint <endpoint>]";
}

auto parseTransferOptions(const std::vector<std::string>& args) -> std::optional<TransferOptions> {
    TransferOptions options{
        .input_path = "",
        .output_path = "",
        .indefinite = false,
        .log_endpoint = std::nullopt,
    };
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--indefinite") {
            options.indefinite = true;
        }
        else if (args[i] == "--log-endpoint") {
            if (i + 1 >= args.size()) return std::nullopt;
            options.log_endpoint = args[++i];
        }
        else if (args[i].starts_with("--")) {
            return std::nullopt;
        }
        else {
            positional.push_back(args[i]);
        }
    }

    if (positional.size() != 2) return std::nullopt;

    options.input_path = positional[0];
    options.output_path = positional[1];

    return options;
}

static auto scalarValue(const nlohmann::json& doc) -> Value {
    switch (doc.type()) {
    case nlohmann::json::value_t::boolean:
        return Value(doc.get<bool>());
    case nlohmann::json::value_t::number_unsigned:
        return Value(doc.get<uint64_t>());
    case nlohmann::json::value_t::number_integer:
        return Value(doc.get<int64_t>());
    case nlohmann::json::value_t::number_float:
        return Value(doc.get<double>());
    case nlohmann::json::value_t::string:
        return Value(doc.get_ref<const std::string&>());
    case nlohmann::json::value_t::binary:
        {
            auto& bin = doc.get_binary();
            return Value(Bytes(bin.begin(), bin.end()));
        }
    case nlohmann::json::value_t::null:
    default:
        return Value(nullptr);
    }
}

static auto containerLength(const nlohmann::json& doc, bool indefinite) -> Length {
    return indefinite ? Length::indefinite() : Length(doc.size());
}

static auto transferEntry(MapWriter& writer, const std::string& key, const nlohmann::json& doc, bool indefinite) -> void;

template <SequenceWriter W>
static auto transferValue(W& writer, const nlohmann::json& doc, bool indefinite) -> void {
    if (doc.is_array()) {
        auto scope = writer.array(containerLength(doc, indefinite));
        for (auto& item: doc) {
            transferValue(scope.writer(), item, indefinite);
        }
        scope.close();
    }
    else if (doc.is_object()) {
        auto scope = writer.map(containerLength(doc, indefinite));
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            transferEntry(scope.writer(), it.key(), it.value(), indefinite);
        }
        scope.close();
    }
    else {
        writer.write(scalarValue(doc));
    }
}

static auto transferEntry(MapWriter& writer, const std::string& key, const nlohmann::json& doc, bool indefinite) -> void {
    if (doc.is_array()) {
        auto scope = writer.array(key, containerLength(doc, indefinite));
        for (auto& item: doc) {
            transferValue(scope.writer(), item, indefinite);
        }
        scope.close();
    }
    else if (doc.is_object()) {
        auto scope = writer.map(key, containerLength(doc, indefinite));
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            transferEntry(scope.writer(), it.key(), it.value(), indefinite);
        }
        scope.close();
    }
    else {
        writer.write(key, scalarValue(doc));
    }
}

auto transferJson(Writer& writer, const nlohmann::json& doc, bool indefinite) -> void {
    transferValue(writer, doc, indefinite);
}

static auto writeDocument(const nlohmann::json& doc, std::ostream& out, bool indefinite, LogChannel& channel) -> void {
    CborEncoder encoder(out);
    Writer writer(encoder, &channel);

    transferJson(writer, doc, indefinite);
    out.flush();
}

auto runTransfer(const TransferOptions& options, LogChannel& channel) -> TransferResultCode {
    nlohmann::json doc;

    read: {
        std::ifstream file;
        if (options.input_path != "-") {
            file.open(options.input_path);
            if (! file) {
                channel.err(std::format("Cannot open input file: {}", options.input_path));
                return TransferResultCode::usage_error;
            }
        }

        try {
            doc = nlohmann::json::parse((options.input_path == "-") ? std::cin : file);
        }
        catch (const nlohmann::json::parse_error& ex) {
            channel.err(std::format("Invalid JSON document: {}", ex.what()));
            return TransferResultCode::invalid_json;
        }
    }

    write: {
        try {
            if (options.output_path == "-") {
                writeDocument(doc, std::cout, options.indefinite, channel);
            }
            else {
                std::ofstream out(options.output_path, std::ios::binary);
                if (! out) {
                    channel.err(std::format("Cannot open output file: {}", options.output_path));
                    return TransferResultCode::encode_failed;
                }

                writeDocument(doc, out, options.indefinite, channel);
            }
        }
        catch (const WriterProtocolError& ex) {
            channel.err(std::format("Writer protocol error: {}", ex.what()));
            return TransferResultCode::encode_failed;
        }
        catch (const EncodeError& ex) {
            channel.err(std::format("Encode failed: {}", ex.what()));
            return TransferResultCode::encode_failed;
        }
    }

    channel.info(std::format("Transferred `{}` to `{}`", options.input_path, options.output_path));

    return TransferResultCode::no_error;
}

}
