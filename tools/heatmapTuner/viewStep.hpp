#pragma once

namespace bullpen {

//! View shown by the tuner window.
enum class ViewStep {
	Heatmap,       //!< Final raster with the zone overlay.
	DensityStages, //!< Mosaic of the accumulated, smoothed and normalised grids.
	Badges,        //!< Badge results of the loaded session.
};

} // namespace bullpen
