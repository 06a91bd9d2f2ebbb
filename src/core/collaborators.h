/**
 * @file collaborators.h
 * @brief Interfaces the simulation calls out to
 *
 * The core never draws, plays or stores anything itself. Hosts provide
 * these seams; the Null* versions do nothing and suit headless runs.
 */

#pragma once

#include <string>

namespace paddleball {

struct Settings;

/// Logical image names supplied by the asset pipeline.
enum class ImageId {
    Background,
    Ball
};

/// Logical sound names supplied by the asset pipeline.
enum class SoundCue {
    Bounce,
    Score
};

/**
 * @brief Drawing surface for one frame
 */
class Surface {
public:
    virtual ~Surface() = default;
    virtual void clear(unsigned int color) = 0;
    virtual void draw_image(ImageId image, double x, double y, double w, double h) = 0;
    virtual void fill_rect(double x, double y, double w, double h, unsigned int color) = 0;
    /// Called once the frame's draw calls are done.
    virtual void present() {}
};

/**
 * @brief Banner, button, score and glyph presentation
 */
class Overlay {
public:
    virtual ~Overlay() = default;
    virtual void set_styles(const Settings& settings) = 0;
    virtual void hide_loading() = 0;
    virtual void set_banner(const std::string& text) = 0;
    virtual void hide_banner() = 0;
    virtual void set_button(const std::string& text) = 0;
    virtual void hide_button() = 0;
    virtual void set_instructions(const std::string& desktop, const std::string& mobile) = 0;
    virtual void hide_instructions() = 0;
    virtual void show_stats() = 0;
    virtual void set_score1(const std::string& text) = 0;
    virtual void set_score2(const std::string& text) = 0;
    virtual void set_mute(bool muted) = 0;
    virtual void set_pause(bool paused) = 0;
};

/**
 * @brief Sound playback
 */
class AudioSink {
public:
    virtual ~AudioSink() = default;
    virtual void play(SoundCue cue) = 0;
    virtual void start_music() = 0;
    virtual void suspend() = 0;
    virtual void resume() = 0;
};

/**
 * @brief Persisted boolean preferences
 */
class PreferenceStore {
public:
    virtual ~PreferenceStore() = default;
    virtual bool get_bool(const std::string& key, bool fallback) const = 0;
    /// @return false if the value could not be persisted
    virtual bool set_bool(const std::string& key, bool value) = 0;
};

class NullSurface : public Surface {
public:
    void clear(unsigned int) override {}
    void draw_image(ImageId, double, double, double, double) override {}
    void fill_rect(double, double, double, double, unsigned int) override {}
};

class NullOverlay : public Overlay {
public:
    void set_styles(const Settings&) override {}
    void hide_loading() override {}
    void set_banner(const std::string&) override {}
    void hide_banner() override {}
    void set_button(const std::string&) override {}
    void hide_button() override {}
    void set_instructions(const std::string&, const std::string&) override {}
    void hide_instructions() override {}
    void show_stats() override {}
    void set_score1(const std::string&) override {}
    void set_score2(const std::string&) override {}
    void set_mute(bool) override {}
    void set_pause(bool) override {}
};

class NullAudio : public AudioSink {
public:
    void play(SoundCue) override {}
    void start_music() override {}
    void suspend() override {}
    void resume() override {}
};

/**
 * @brief Everything a GameCore talks to, by reference
 *
 * The referenced objects must outlive the core.
 */
struct Collaborators {
    Surface& surface;
    Overlay& overlay;
    AudioSink& audio;
    PreferenceStore& prefs;
};

} // namespace paddleball
