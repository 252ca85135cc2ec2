/**
 * @file video_overlay.hpp
 * @brief FFmpeg execution for burning a static overlay into a video
 *
 * @details The video composite is delegated to the ffmpeg executable:
 *
 *          - overlay image looped for the video's duration
 *
 *          - scaled to the displayed frame size when it differs
 *
 *          - centered on the frame, original audio re-encoded alongside
 */

#ifndef SNAPMERGE_VIDEO_OVERLAY_HPP
#define SNAPMERGE_VIDEO_OVERLAY_HPP

#include <filesystem>
#include <string>

#include "types.hpp"

namespace snapmerge {

/**
 * @brief Build the -filter_complex graph for a centered static overlay.
 *
 * @param video Probed video properties (display size)
 * @param overlay_width Overlay image width
 * @param overlay_height Overlay image height
 * @return Filter graph producing the labelled output "[v]"
 */
std::string build_overlay_filter(const VideoInfo &video, int overlay_width,
                                 int overlay_height);

/**
 * @brief Composite a static overlay over a video and encode it as MP4.
 *
 * @param media Input video
 * @param overlay Overlay image (PNG with alpha)
 * @param video Probed properties of media
 * @param overlay_info Probed size of the overlay image
 * @param output Destination file (written as MP4 regardless of its name)
 * @throws CodecError if the ffmpeg executable is missing or fails
 */
void execute_ffmpeg_overlay(const std::filesystem::path &media,
                            const std::filesystem::path &overlay,
                            const VideoInfo &video,
                            const ImageInfo &overlay_info,
                            const std::filesystem::path &output);

} // namespace snapmerge

#endif // SNAPMERGE_VIDEO_OVERLAY_HPP
