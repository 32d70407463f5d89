// Source for FeedwiseJuceHeaderHelper, the console target whose only job is
// to make juce_generate_juce_header() emit JuceHeader.h for the libraries.
#include <JuceHeader.h>

int main()
{
    return juce::SystemStats::getJUCEVersion().isEmpty() ? 1 : 0;
}
