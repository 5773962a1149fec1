// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <cstdio>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <absl/log/log.h>
#include <absl/strings/str_format.h>

#include <hevcbox/app/vlog_flags.h>
#include <hevcbox/file.h>
#include <hevcbox/file/file_closer.h>
#include <hevcbox/hevc_sample_entry_config.h>
#include <hevcbox/media/formats/mp4/box_definitions.h>
#include <hevcbox/media/formats/mp4/sample_entry_codec.h>
#include <hevcbox/utils/absl_flag_hexbytes.h>

ABSL_FLAG(std::string,
          input,
          "",
          "File to read an hvc1/hev1 sample entry box from.");
ABSL_FLAG(uint64_t,
          offset,
          0,
          "Byte offset of the sample entry box in --input.");
ABSL_FLAG(bool, dump, false, "Print every field of the decoded sample entry.");
ABSL_FLAG(bool,
          summary,
          false,
          "Print a one-line summary of the decoded sample entry.");

ABSL_FLAG(std::string,
          output,
          "",
          "File to write a sample entry built from the flags below to.");
ABSL_FLAG(uint32_t, width, 0, "Coded width in pixels.");
ABSL_FLAG(uint32_t, height, 0, "Coded height in pixels.");
ABSL_FLAG(hevcbox::HexBytesList,
          vps,
          hevcbox::HexBytesList(),
          "Comma separated hex strings, one per video parameter set NAL unit.");
ABSL_FLAG(hevcbox::HexBytesList,
          sps,
          hevcbox::HexBytesList(),
          "Comma separated hex strings, one per sequence parameter set NAL "
          "unit.");
ABSL_FLAG(hevcbox::HexBytesList,
          pps,
          hevcbox::HexBytesList(),
          "Comma separated hex strings, one per picture parameter set NAL "
          "unit.");
ABSL_FLAG(hevcbox::HexBytesList,
          sei,
          hevcbox::HexBytesList(),
          "Comma separated hex strings, one per prefix SEI NAL unit.");
ABSL_FLAG(hevcbox::HexBytes,
          general_configuration,
          hevcbox::HexBytes(),
          "12 bytes in hex, general_profile_space through general_level_idc. "
          "All zero if not set.");
ABSL_FLAG(uint32_t, chroma_format_idc, 1, "chroma_format_idc, 0 to 3.");
ABSL_FLAG(uint32_t, bit_depth_luma_minus8, 0, "Luma bit depth minus 8.");
ABSL_FLAG(uint32_t, bit_depth_chroma_minus8, 0, "Chroma bit depth minus 8.");
ABSL_FLAG(uint32_t,
          num_temporal_layers,
          1,
          "Number of temporal layers, 0 to 7.");
ABSL_FLAG(bool, temporal_id_nested, false, "Set temporalIdNested.");
ABSL_FLAG(bool, hev1, false, "Write an 'hev1' instead of an 'hvc1' box.");
ABSL_FLAG(bool, quiet, false, "When enabled, LOG(INFO) output is suppressed.");

namespace hevcbox {
namespace {

const char kUsage[] =
    "%s [flags]\n\n"
    "  Decode an HEVC sample entry:\n"
    "    --input=<file> [--offset=<bytes>] [--dump | --summary]\n"
    "  Build an HEVC sample entry:\n"
    "    --output=<file> --width=<w> --height=<h> --vps=<hex>,...\n"
    "    --sps=<hex>,... --pps=<hex>,... [--sei=<hex>,...]\n"
    "    [--general_configuration=<hex>] [--hev1] ...\n\n"
    "  File names may carry a 'file://' or 'memory://' prefix.\n";

enum ExitStatus {
  kSuccess = 0,
  kArgumentValidationFailed,
  kDecodeFailed,
  kEncodeFailed,
};

bool ValidateFlags() {
  bool success = true;
  if (absl::GetFlag(FLAGS_input).empty() ==
      absl::GetFlag(FLAGS_output).empty()) {
    LOG(ERROR) << "Exactly one of --input and --output is required.";
    success = false;
  }
  if (absl::GetFlag(FLAGS_dump) && absl::GetFlag(FLAGS_summary)) {
    LOG(ERROR) << "--dump and --summary cannot both be set.";
    success = false;
  }
  if (absl::GetFlag(FLAGS_width) > std::numeric_limits<uint16_t>::max() ||
      absl::GetFlag(FLAGS_height) > std::numeric_limits<uint16_t>::max()) {
    LOG(ERROR) << "--width and --height must fit in 16 bits.";
    success = false;
  }
  const size_t general_configuration_size =
      absl::GetFlag(FLAGS_general_configuration).bytes.size();
  if (general_configuration_size != 0 &&
      general_configuration_size !=
          media::mp4::HEVCDecoderConfiguration::kGeneralConfigurationSize) {
    LOG(ERROR) << "--general_configuration must be 12 bytes, got "
               << general_configuration_size << ".";
    success = false;
  }
  if (absl::GetFlag(FLAGS_chroma_format_idc) > 3) {
    LOG(ERROR) << "--chroma_format_idc must be in the range [0, 3].";
    success = false;
  }
  if (absl::GetFlag(FLAGS_bit_depth_luma_minus8) > 7 ||
      absl::GetFlag(FLAGS_bit_depth_chroma_minus8) > 7) {
    LOG(ERROR) << "Bit depths minus 8 must be in the range [0, 7].";
    success = false;
  }
  if (absl::GetFlag(FLAGS_num_temporal_layers) > 7) {
    LOG(ERROR) << "--num_temporal_layers must be in the range [0, 7].";
    success = false;
  }
  return success;
}

HEVCSampleEntryConfig GetSampleEntryConfig() {
  HEVCSampleEntryConfig config;
  config.width = static_cast<uint16_t>(absl::GetFlag(FLAGS_width));
  config.height = static_cast<uint16_t>(absl::GetFlag(FLAGS_height));
  config.vps = absl::GetFlag(FLAGS_vps).entries;
  config.sps = absl::GetFlag(FLAGS_sps).entries;
  config.pps = absl::GetFlag(FLAGS_pps).entries;
  config.sei = absl::GetFlag(FLAGS_sei).entries;
  config.general_configuration =
      absl::GetFlag(FLAGS_general_configuration).bytes;
  config.chroma_format_idc =
      static_cast<uint8_t>(absl::GetFlag(FLAGS_chroma_format_idc));
  config.bit_depth_luma_minus8 =
      static_cast<uint8_t>(absl::GetFlag(FLAGS_bit_depth_luma_minus8));
  config.bit_depth_chroma_minus8 =
      static_cast<uint8_t>(absl::GetFlag(FLAGS_bit_depth_chroma_minus8));
  config.num_temporal_layers =
      static_cast<uint8_t>(absl::GetFlag(FLAGS_num_temporal_layers));
  config.temporal_id_nested = absl::GetFlag(FLAGS_temporal_id_nested);
  config.use_hev1 = absl::GetFlag(FLAGS_hev1);
  return config;
}

int DecodeSampleEntry() {
  const std::string input = absl::GetFlag(FLAGS_input);
  std::unique_ptr<File, FileCloser> file(File::Open(input.c_str(), "r"));
  if (!file) {
    LOG(ERROR) << "Cannot open " << input;
    return kDecodeFailed;
  }
  const uint64_t offset = absl::GetFlag(FLAGS_offset);
  if (offset != 0 && !file->Seek(offset)) {
    LOG(ERROR) << "Cannot seek to " << offset << " in " << input;
    return kDecodeFailed;
  }

  media::mp4::HEVCSampleEntry entry;
  Status status = media::mp4::ReadSampleEntry(file.get(), &entry);
  if (!status.ok()) {
    LOG(ERROR) << "Failed to decode sample entry: " << status;
    return kDecodeFailed;
  }

  if (absl::GetFlag(FLAGS_dump))
    std::cout << entry.ToString();
  else
    std::cout << entry.Summary() << std::endl;
  return kSuccess;
}

int EncodeSampleEntry() {
  media::mp4::HEVCSampleEntry entry =
      media::mp4::HEVCSampleEntry::FromConfig(GetSampleEntryConfig());

  const std::string output = absl::GetFlag(FLAGS_output);
  std::unique_ptr<File, FileCloser> file(File::Open(output.c_str(), "w"));
  if (!file) {
    LOG(ERROR) << "Cannot open " << output << " for writing.";
    return kEncodeFailed;
  }
  uint64_t bytes_written = 0;
  Status status =
      media::mp4::WriteSampleEntry(&entry, file.get(), &bytes_written);
  if (!status.ok()) {
    LOG(ERROR) << "Failed to encode sample entry: " << status;
    return kEncodeFailed;
  }
  if (!absl::GetFlag(FLAGS_quiet)) {
    printf("Wrote %s box of %llu bytes to %s.\n",
           media::FourCCToString(entry.format).c_str(),
           static_cast<unsigned long long>(bytes_written), output.c_str());
  }
  return kSuccess;
}

int HevcboxMain(int argc, char** argv) {
  auto usage = absl::StrFormat(kUsage, argv[0]);
  absl::SetProgramUsageMessage(usage);
  absl::ParseCommandLine(argc, argv);

  if (absl::GetFlag(FLAGS_quiet)) {
    absl::SetMinLogLevel(absl::LogSeverityAtLeast::kWarning);
  }

  handle_vlog_flags();

  absl::InitializeLog();

  if (!ValidateFlags()) {
    std::cerr << "Usage: " << absl::ProgramUsageMessage();
    return kArgumentValidationFailed;
  }

  if (!absl::GetFlag(FLAGS_input).empty())
    return DecodeSampleEntry();
  return EncodeSampleEntry();
}

}  // namespace
}  // namespace hevcbox

int main(int argc, char** argv) {
  return hevcbox::HevcboxMain(argc, argv);
}
