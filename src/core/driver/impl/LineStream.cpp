#include "core/driver/impl/LineStream.hpp"
#include "core/serial/handler/GCodeStreamer.hpp"
#include "core/types/Error.hpp"

namespace core::driver {

    namespace {
        uint64_t sequenceBytes(const std::vector<std::string> &sequence) {
            uint64_t bytes = 0;
            for (const auto &line: sequence) {
                bytes += line.size() + 1;
            }
            return bytes;
        }
    }

    LineStream::LineStream(const std::string &toolpathPath, const profile::DriverProfile &profile)
            : toolpathPath_(toolpathPath) {
        if (profile.withStartEnd) {
            startSequence_ = profile.startSequence;
            endSequence_ = profile.endSequence;
        }

        std::ifstream counter(toolpathPath, std::ios::binary);
        if (!counter.is_open()) {
            throw types::ConveyorException("Cannot open toolpath " + toolpathPath);
        }

        uint64_t lines = 0;
        uint64_t bytes = 0;
        std::string line;
        while (std::getline(counter, line)) {
            ++lines;
            bytes += line.size() + 1;
        }

        progress_.totalLines = lines + startSequence_.size() + endSequence_.size();
        progress_.totalBytes = bytes + sequenceBytes(startSequence_) + sequenceBytes(endSequence_);

        toolpath_.open(toolpathPath, std::ios::binary);
        if (!toolpath_.is_open()) {
            throw types::ConveyorException("Cannot open toolpath " + toolpathPath);
        }
    }

    std::optional<PrintProgress> LineStream::next() {
        std::string line;
        while (nextRawLine(line)) {
            ++progress_.currentLine;
            progress_.currentByte += line.size() + 1;

            std::string command = serial::GCodeStreamer::stripComment(line);
            if (command.empty()) {
                continue;
            }

            emit(command);
            progress_.temperature = temperature();
            return progress_;
        }
        return std::nullopt;
    }

    bool LineStream::nextRawLine(std::string &line) {
        while (true) {
            switch (phase_) {
                case Phase::START:
                    if (sequenceIndex_ < startSequence_.size()) {
                        line = startSequence_[sequenceIndex_++];
                        return true;
                    }
                    phase_ = Phase::BODY;
                    sequenceIndex_ = 0;
                    break;
                case Phase::BODY:
                    if (std::getline(toolpath_, line)) {
                        if (!line.empty() && line.back() == '\r') {
                            line.pop_back();
                            ++progress_.currentByte;
                        }
                        return true;
                    }
                    phase_ = Phase::END;
                    break;
                case Phase::END:
                    if (sequenceIndex_ < endSequence_.size()) {
                        line = endSequence_[sequenceIndex_++];
                        return true;
                    }
                    phase_ = Phase::DONE;
                    break;
                case Phase::DONE:
                    return false;
            }
        }
    }

} // namespace core::driver
