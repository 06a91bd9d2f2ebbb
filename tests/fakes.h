#pragma once

#include "core/collaborators.h"
#include <string>
#include <vector>

namespace paddleball {
namespace testing_support {

class CountingSurface : public Surface {
public:
    void clear(unsigned int) override { ++clears; }
    void draw_image(ImageId image, double x, double, double, double) override {
        if (image == ImageId::Ball) { ++balls; last_ball_x = x; }
    }
    void fill_rect(double, double, double, double, unsigned int) override { ++rects; }
    void present() override { ++frames; }

    int clears = 0;
    int balls = 0;
    int rects = 0;
    int frames = 0;
    double last_ball_x = 0.0;
};

class RecordingOverlay : public Overlay {
public:
    void set_styles(const Settings&) override { styled = true; }
    void hide_loading() override { loading_hidden = true; }
    void set_banner(const std::string& text) override { banner = text; }
    void hide_banner() override { banner.clear(); }
    void set_button(const std::string& text) override { button = text; }
    void hide_button() override { button.clear(); }
    void set_instructions(const std::string& desktop, const std::string&) override { instructions = desktop; }
    void hide_instructions() override { instructions.clear(); }
    void show_stats() override { stats = true; }
    void set_score1(const std::string& text) override { score1 = text; }
    void set_score2(const std::string& text) override { score2 = text; }
    void set_mute(bool m) override { muted = m; }
    void set_pause(bool p) override { paused = p; }

    bool styled = false;
    bool loading_hidden = false;
    bool stats = false;
    bool muted = false;
    bool paused = false;
    std::string banner, button, instructions, score1, score2;
};

class RecordingAudio : public AudioSink {
public:
    void play(SoundCue cue) override { cues.push_back(cue); }
    void start_music() override { ++music_starts; }
    void suspend() override { suspended = true; }
    void resume() override { suspended = false; }

    int count(SoundCue cue) const {
        int n = 0;
        for (SoundCue c : cues) if (c == cue) ++n;
        return n;
    }

    std::vector<SoundCue> cues;
    int music_starts = 0;
    bool suspended = false;
};

} // namespace testing_support
} // namespace paddleball
