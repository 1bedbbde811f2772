#include <flora/config.h>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace flora {

namespace {

bool typeMatches(const json& value, bool*) { return value.is_boolean(); }
bool typeMatches(const json& value, int*) { return value.is_number_integer(); }
bool typeMatches(const json& value, float*) { return value.is_number(); }

template<typename T>
bool readParam(const json& j, Param<T>& param) {
    auto it = j.find(param.name());
    if (it == j.end()) return true;

    if (!typeMatches(*it, static_cast<T*>(nullptr))) {
        std::cerr << "[Config] Ignoring '" << param.name() << "': unexpected type "
                  << it->type_name() << "\n";
        return false;
    }
    param = it->template get<T>();
    return true;
}

template<typename T>
int clampParam(Param<T>& param) {
    T before = param;
    if (!param.clamp()) return 0;
    std::cerr << "[Config] " << param.name() << " = " << before
              << " out of range [" << param.min() << ", " << param.max()
              << "], using " << param.get() << "\n";
    return 1;
}

} // namespace

bool FloraConfig::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Cannot open " << path << "\n";
        return false;
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::exception& e) {
        std::cerr << "[Config] Failed to parse " << path << ": " << e.what() << "\n";
        return false;
    }

    bool ok = loadJson(j);
    std::cout << "[Config] Loaded " << path << "\n";
    return ok;
}

bool FloraConfig::loadJson(const json& j) {
    if (!j.is_object()) {
        std::cerr << "[Config] Expected a JSON object at top level\n";
        return false;
    }

    bool ok = true;
    ok &= readParam(j, width);
    ok &= readParam(j, height);
    ok &= readParam(j, fullscreen);
    ok &= readParam(j, fps);
    ok &= readParam(j, seed);
    ok &= readParam(j, overlay);
    ok &= readParam(j, frames);

    auto it = j.find("audio");
    if (it != j.end()) {
        if (!it->is_object()) {
            std::cerr << "[Config] Ignoring 'audio': expected an object\n";
            return false;
        }
        const json& a = *it;
        ok &= readParam(a, audio.sampleRate);
        ok &= readParam(a, audio.frameSize);
        ok &= readParam(a, audio.device);
        ok &= readParam(a, audio.synthetic);
        ok &= readParam(a, audio.window);
        ok &= readParam(a, audio.bassLow);
        ok &= readParam(a, audio.bassHigh);
        ok &= readParam(a, audio.midsHigh);
        ok &= readParam(a, audio.trebleHigh);
    }
    return ok;
}

json FloraConfig::toJson() const {
    json j;
    j[width.name()] = width.get();
    j[height.name()] = height.get();
    j[fullscreen.name()] = fullscreen.get();
    j[fps.name()] = fps.get();
    j[seed.name()] = seed.get();
    j[overlay.name()] = overlay.get();
    j[frames.name()] = frames.get();

    json a;
    a[audio.sampleRate.name()] = audio.sampleRate.get();
    a[audio.frameSize.name()] = audio.frameSize.get();
    a[audio.device.name()] = audio.device.get();
    a[audio.synthetic.name()] = audio.synthetic.get();
    a[audio.window.name()] = audio.window.get();
    a[audio.bassLow.name()] = audio.bassLow.get();
    a[audio.bassHigh.name()] = audio.bassHigh.get();
    a[audio.midsHigh.name()] = audio.midsHigh.get();
    a[audio.trebleHigh.name()] = audio.trebleHigh.get();
    j["audio"] = a;
    return j;
}

int FloraConfig::validate() {
    int changed = 0;
    changed += clampParam(width);
    changed += clampParam(height);
    changed += clampParam(fps);
    changed += clampParam(seed);
    changed += clampParam(frames);
    changed += clampParam(audio.sampleRate);
    changed += clampParam(audio.frameSize);
    changed += clampParam(audio.device);
    changed += clampParam(audio.bassLow);
    changed += clampParam(audio.bassHigh);
    changed += clampParam(audio.midsHigh);
    changed += clampParam(audio.trebleHigh);

    // Bands must be ordered and fit below Nyquist
    float nyquist = audio.sampleRate / 2.0f;
    bool ordered = audio.bassLow < audio.bassHigh &&
                   audio.bassHigh < audio.midsHigh &&
                   audio.midsHigh < audio.trebleHigh &&
                   audio.trebleHigh <= nyquist;
    if (!ordered) {
        std::cerr << "[Config] Band edges " << audio.bassLow.get() << "/" << audio.bassHigh.get()
                  << "/" << audio.midsHigh.get() << "/" << audio.trebleHigh.get()
                  << " Hz are not increasing below " << nyquist << " Hz, using defaults\n";
        audio.bassLow.reset();
        audio.bassHigh.reset();
        audio.midsHigh.reset();
        audio.trebleHigh.reset();
        changed += 4;
    }
    return changed;
}

std::vector<ParamDecl> FloraConfig::params() const {
    std::vector<ParamDecl> decls = {
        width.decl(), height.decl(), fullscreen.decl(), fps.decl(), seed.decl(),
        overlay.decl(), frames.decl()
    };
    for (ParamDecl decl : {audio.sampleRate.decl(), audio.frameSize.decl(), audio.device.decl(),
                           audio.synthetic.decl(), audio.window.decl(),
                           audio.bassLow.decl(), audio.bassHigh.decl(), audio.midsHigh.decl(),
                           audio.trebleHigh.decl()}) {
        decl.name = "audio." + decl.name;
        decls.push_back(decl);
    }
    return decls;
}

} // namespace flora
